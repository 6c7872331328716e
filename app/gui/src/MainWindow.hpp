#pragma once
#include <QMainWindow>
#include <QString>

#include <lb/sweep/term_sweep.hpp>

#include "SweepWorker.hpp"

class QThread;

namespace Ui { class MainWindow; }

namespace QtCharts {
class QChart;
class QChartView;
class QValueAxis;
}

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

  // Charge un fichier de paramètres au démarrage (argument de ligne de commande).
  void loadParamsFile(const QString& path);

private slots:
  void onLoadJson();
  void onRunSweep();
  void onExportCsv();
  void onModeChanged(int index);

  void onParamsLoaded(gui::SweepInput in);
  void onSweepFinished(lb::sweep::TermResults plain,
                       lb::sweep::TermResults overpayment,
                       lb::sweep::TermResults investSurplus,
                       double acceptable);
  void onWorkerMessage(const QString& text);
  void onWorkerFailed(const QString& why);

private:
  // Un graphe "métrique vs années"
  struct ChartSlot {
    QtCharts::QChart*     chart{nullptr};
    QtCharts::QChartView* view{nullptr};
    QtCharts::QValueAxis* axX{nullptr};
    QtCharts::QValueAxis* axY{nullptr};
  };

  void setupCharts();
  void setupTable();
  void startWorker();
  void stopWorker();

  gui::SweepInput readInputs() const;
  void updateBudgetEnabled(bool on);

  QtCharts::QChartView* createChartInPlaceholder(QWidget* ph, QtCharts::QChart* chart);
  void initChart(ChartSlot& slot, QWidget* ph, const QString& title, const QString& yTitle);
  // Remplace les séries d'un graphe ; metric = pointeur vers un champ de TermResult
  void plotMetric(ChartSlot& slot, double lb::sweep::TermResult::* metric, double hLine);
  void fillTable(const lb::sweep::TermResults& r);
  const lb::sweep::TermResults* selectedResults() const;

  Ui::MainWindow* ui{nullptr};

  QThread* sweepThread_{nullptr};
  gui::SweepWorker* worker_{nullptr};

  ChartSlot payment_;
  ChartSlot cost_;
  ChartSlot adjusted_;

  // Derniers résultats (copie locale, lecture seule)
  lb::sweep::TermResults plain_;
  lb::sweep::TermResults over_;
  lb::sweep::TermResults invest_;
  double acceptable_{-1.0};
};
