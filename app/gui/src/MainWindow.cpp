#include "MainWindow.hpp"
#include "ui_MainWindow.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDebug>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QHeaderView>
#include <QMessageBox>
#include <QMetaObject>
#include <QPainter>
#include <QPushButton>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QTableWidget>
#include <QTableWidgetItem>
#include <QThread>
#include <QVBoxLayout>

#include <QtCharts/QChart>
#include <QtCharts/QChartView>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include <lb/io/report.hpp>

namespace {
const QColor C_PLAIN (33,150,243);   // plain (blue)
const QColor C_OVER  (255,152,0);    // overpayment (orange)
const QColor C_INVEST(76,175,80);    // invest-surplus (green)
const QColor C_LIMIT (244,67,54);    // acceptable payment (red, dashed)

const char* kTableHeaders[] = {"Years", "Monthly payment", "Total cost",
                               "Adjusted cost", "Investment", "Payoff (months)"};
}

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);
  // Enregistrements pour les queued connections
  qRegisterMetaType<gui::SweepInput>("gui::SweepInput");
  qRegisterMetaType<lb::sweep::TermResults>("lb::sweep::TermResults");

  setupCharts();
  setupTable();
  startWorker();

  connect(ui->btnLoad,      &QPushButton::clicked, this, &MainWindow::onLoadJson);
  connect(ui->btnRun,       &QPushButton::clicked, this, &MainWindow::onRunSweep);
  connect(ui->btnExportCsv, &QPushButton::clicked, this, &MainWindow::onExportCsv);
  connect(ui->chkBudget,    &QCheckBox::toggled,   this, &MainWindow::updateBudgetEnabled);
  connect(ui->cbMode, qOverload<int>(&QComboBox::currentIndexChanged),
          this, &MainWindow::onModeChanged);

  ui->btnExportCsv->setEnabled(false);
  statusBar()->showMessage("Ready");
}

MainWindow::~MainWindow() {
  stopWorker();
  delete ui;
}

void MainWindow::startWorker() {
  if (sweepThread_ && worker_) return;

  sweepThread_ = new QThread(this);
  worker_ = new gui::SweepWorker();              // PAS de parent → vit dans sweepThread_
  worker_->moveToThread(sweepThread_);
  connect(sweepThread_, &QThread::finished, worker_, &QObject::deleteLater);

  connect(worker_, &gui::SweepWorker::paramsLoaded,  this, &MainWindow::onParamsLoaded,  Qt::QueuedConnection);
  connect(worker_, &gui::SweepWorker::sweepFinished, this, &MainWindow::onSweepFinished, Qt::QueuedConnection);
  connect(worker_, &gui::SweepWorker::message,       this, &MainWindow::onWorkerMessage, Qt::QueuedConnection);
  connect(worker_, &gui::SweepWorker::failed,        this, &MainWindow::onWorkerFailed,  Qt::QueuedConnection);

  sweepThread_->start();
}

void MainWindow::stopWorker() {
  if (!sweepThread_) return;
  if (worker_) QObject::disconnect(worker_, nullptr, this, nullptr);
  sweepThread_->quit();
  sweepThread_->wait();
  sweepThread_ = nullptr;
  worker_ = nullptr; // détruit par deleteLater
}

QtCharts::QChartView* MainWindow::createChartInPlaceholder(QWidget* ph, QtCharts::QChart* chart)
{
  using namespace QtCharts;
  auto* view = new QChartView(chart, ph);
  view->setRenderHint(QPainter::Antialiasing);
  view->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
  auto* lay = new QVBoxLayout(ph);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(view);
  return view;
}

void MainWindow::initChart(ChartSlot& slot, QWidget* ph, const QString& title, const QString& yTitle) {
  using namespace QtCharts;
  slot.chart = new QChart();
  slot.chart->setTitle(title);
  slot.chart->setMargins(QMargins(8,8,18,12));
  slot.chart->legend()->setVisible(true);

  slot.axX = new QValueAxis(); slot.axX->setTitleText("Years"); slot.axX->setLabelFormat("%d");
  slot.axX->setRange(lb::sweep::kMinTermYears, lb::sweep::kMaxTermYears);
  slot.axX->setTickCount(lb::sweep::kMaxTermYears - lb::sweep::kMinTermYears + 1);
  slot.axY = new QValueAxis(); slot.axY->setTitleText(yTitle); slot.axY->setLabelFormat("%.0f");
  slot.chart->addAxis(slot.axX, Qt::AlignBottom);
  slot.chart->addAxis(slot.axY, Qt::AlignLeft);

  slot.view = createChartInPlaceholder(ph, slot.chart);
}

void MainWindow::setupCharts() {
  initChart(payment_,  ui->chartPaymentPH,  "Monthly Payment vs Years",        "Monthly payment");
  initChart(cost_,     ui->chartCostPH,     "Total Cost vs Years",             "Total cost");
  initChart(adjusted_, ui->chartAdjustedPH, "Inflation-Adjusted Cost vs Years","Inflation-adjusted cost");
}

void MainWindow::setupTable() {
  ui->tableResults->setColumnCount(6);
  QStringList headers;
  for (const char* h : kTableHeaders) headers << h;
  ui->tableResults->setHorizontalHeaderLabels(headers);
  ui->tableResults->verticalHeader()->setVisible(false);
  ui->tableResults->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  ui->tableResults->setEditTriggers(QAbstractItemView::NoEditTriggers);
}

void MainWindow::updateBudgetEnabled(bool on) {
  ui->sbAcceptable->setEnabled(on);
  ui->sbInvestRate->setEnabled(on);
}

gui::SweepInput MainWindow::readInputs() const {
  gui::SweepInput in;
  in.principal  = ui->sbPrincipal->value();
  in.creditRate = ui->sbRate->value();
  in.inflation  = ui->sbInflation->value();
  in.withBudget = ui->chkBudget->isChecked();
  in.acceptable = ui->sbAcceptable->value();
  in.investRate = ui->sbInvestRate->value();
  return in;
}

void MainWindow::loadParamsFile(const QString& path) {
  QMetaObject::invokeMethod(
      worker_,
      [w=worker_, path]{ w->loadParams(path); },
      Qt::QueuedConnection);
}

void MainWindow::onLoadJson() {
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load parameters"), QString(), tr("JSON (*.json)"));
  if (fn.isEmpty()) return;
  loadParamsFile(fn);
}

void MainWindow::onParamsLoaded(gui::SweepInput in) {
  ui->sbPrincipal->setValue(in.principal);
  ui->sbRate->setValue(in.creditRate);
  ui->sbInflation->setValue(in.inflation);
  ui->chkBudget->setChecked(in.withBudget);
  if (in.withBudget) {
    ui->sbAcceptable->setValue(in.acceptable);
    ui->sbInvestRate->setValue(in.investRate);
  }
  updateBudgetEnabled(in.withBudget);

  const QStringList adjusted = gui::adjustedFields(in, readInputs());
  if (!adjusted.isEmpty()) {
    qWarning() << "[UI] loaded values adjusted by the form:" << adjusted;
    QMessageBox::warning(this, tr("Parameters"),
                         tr("Some values are outside the form limits and were adjusted:\n%1")
                           .arg(adjusted.join("\n")));
  }
  onRunSweep();
}

void MainWindow::onRunSweep() {
  const gui::SweepInput in = readInputs();
  qDebug() << "[UI] runSweep principal=" << in.principal << "rate=" << in.creditRate
           << "inflation=" << in.inflation << "budget=" << in.withBudget;
  ui->btnRun->setEnabled(false);
  statusBar()->showMessage("Computing…");
  QMetaObject::invokeMethod(
      worker_,
      [w=worker_, in]{ w->runSweep(in); },
      Qt::QueuedConnection);
}

void MainWindow::onSweepFinished(lb::sweep::TermResults plain,
                                 lb::sweep::TermResults overpayment,
                                 lb::sweep::TermResults investSurplus,
                                 double acceptable) {
  plain_ = std::move(plain);
  over_ = std::move(overpayment);
  invest_ = std::move(investSurplus);
  acceptable_ = acceptable;

  // Modes affichables dans la table
  {
    const QSignalBlocker block(ui->cbMode);
    const QString current = ui->cbMode->currentText();
    ui->cbMode->clear();
    ui->cbMode->addItem(lb::sweep::to_string(lb::sweep::SweepMode::Plain));
    if (!over_.empty())   ui->cbMode->addItem(lb::sweep::to_string(lb::sweep::SweepMode::Overpayment));
    if (!invest_.empty()) ui->cbMode->addItem(lb::sweep::to_string(lb::sweep::SweepMode::InvestSurplus));
    const int idx = ui->cbMode->findText(current);
    ui->cbMode->setCurrentIndex(idx >= 0 ? idx : 0);
  }

  plotMetric(payment_,  &lb::sweep::TermResult::monthly_payment,     acceptable_);
  plotMetric(cost_,     &lb::sweep::TermResult::total_cost,          -1.0);
  plotMetric(adjusted_, &lb::sweep::TermResult::total_cost_adjusted, -1.0);
  onModeChanged(ui->cbMode->currentIndex());

  ui->btnRun->setEnabled(true);
  ui->btnExportCsv->setEnabled(true);
  statusBar()->showMessage(QString("Sweep done (%1 terms)").arg(plain_.size()));
}

void MainWindow::plotMetric(ChartSlot& slot, double lb::sweep::TermResult::* metric, double hLine) {
  using namespace QtCharts;
  slot.chart->removeAllSeries();

  double ymin = std::numeric_limits<double>::infinity();
  double ymax = -std::numeric_limits<double>::infinity();

  auto addSeries = [&](const lb::sweep::TermResults& r, const QString& name, const QColor& c) {
    if (r.empty()) return;
    auto* s = new QLineSeries();
    s->setName(name);
    s->setPointsVisible(true);
    QPen pen(c); pen.setWidthF(2.0); s->setPen(pen);
    for (const auto& [years, res] : r) {
      const double v = res.*metric;
      s->append(years, v);
      ymin = std::min(ymin, v); ymax = std::max(ymax, v);
    }
    slot.chart->addSeries(s);
    s->attachAxis(slot.axX);
    s->attachAxis(slot.axY);
  };

  addSeries(plain_,  "plain",          C_PLAIN);
  addSeries(over_,   "overpayment",    C_OVER);
  addSeries(invest_, "invest-surplus", C_INVEST);

  // Mensualité acceptable (ligne horizontale)
  if (hLine >= 0.0) {
    auto* lim = new QLineSeries();
    lim->setName("acceptable payment");
    QPen pen(C_LIMIT); pen.setStyle(Qt::DashLine); pen.setWidthF(1.5); lim->setPen(pen);
    lim->append(lb::sweep::kMinTermYears, hLine);
    lim->append(lb::sweep::kMaxTermYears, hLine);
    ymin = std::min(ymin, hLine); ymax = std::max(ymax, hLine);
    slot.chart->addSeries(lim);
    lim->attachAxis(slot.axX);
    lim->attachAxis(slot.axY);
  }

  if (std::isfinite(ymin) && std::isfinite(ymax)) {
    const double pad = std::max(1.0, 0.05 * (ymax - ymin));
    slot.axY->setRange(ymin - pad, ymax + pad);
  }
}

const lb::sweep::TermResults* MainWindow::selectedResults() const {
  lb::sweep::SweepMode mode = lb::sweep::SweepMode::Plain;
  const std::string name = ui->cbMode->currentText().toStdString();
  if (!lb::sweep::parse_mode(name.c_str(), mode)) return &plain_;
  switch (mode) {
    case lb::sweep::SweepMode::Overpayment:   return &over_;
    case lb::sweep::SweepMode::InvestSurplus: return &invest_;
    case lb::sweep::SweepMode::Plain:         break;
  }
  return &plain_;
}

void MainWindow::onModeChanged(int /*index*/) {
  fillTable(*selectedResults());
}

void MainWindow::fillTable(const lb::sweep::TermResults& r) {
  auto* t = ui->tableResults;
  t->setRowCount(static_cast<int>(r.size()));
  auto money = [](double v){ return QString::number(v, 'f', 2); };
  int row = 0;
  for (const auto& [years, res] : r) {
    t->setItem(row, 0, new QTableWidgetItem(QString::number(years)));
    t->setItem(row, 1, new QTableWidgetItem(money(res.monthly_payment)));
    t->setItem(row, 2, new QTableWidgetItem(money(res.total_cost)));
    t->setItem(row, 3, new QTableWidgetItem(money(res.total_cost_adjusted)));
    t->setItem(row, 4, new QTableWidgetItem(money(res.investment_balance)));
    t->setItem(row, 5, new QTableWidgetItem(QString::number(res.months_to_payoff)));
    ++row;
  }
}

void MainWindow::onExportCsv() {
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Export CSV"), QString("sweep_%1.csv").arg(ui->cbMode->currentText()), tr("CSV (*.csv)"));
  if (fn.isEmpty()) return;

  std::string err;
  if (!lb::io::save_results_csv(fn.toStdString(), *selectedResults(), &err)) {
    QMessageBox::warning(this, tr("Export CSV"), QString::fromStdString(err));
    return;
  }
  statusBar()->showMessage(QString("CSV written: %1").arg(fn));
}

void MainWindow::onWorkerMessage(const QString& text) {
  statusBar()->showMessage(text);
}

void MainWindow::onWorkerFailed(const QString& why) {
  qWarning() << "[UI] worker failed:" << why;
  ui->btnRun->setEnabled(true);
  statusBar()->showMessage("Failed");
  QMessageBox::warning(this, "Loan Bench", why);
}
