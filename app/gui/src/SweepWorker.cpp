#include "SweepWorker.hpp"

#include <QDebug>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <lb/config/loan_params.hpp>
#include <lb/io/params_json.hpp>

using gui::SweepWorker;

SweepWorker::SweepWorker(QObject* parent): QObject(parent) {}

void SweepWorker::loadParams(const QString& path) {
  std::vector<std::string> errors, warnings;
  const auto p = lb::io::read_params_json(path.toStdString(), &errors, &warnings);
  for (const auto& w : warnings) emit message(QString::fromStdString(w));
  if (!p) {
    emit failed(errors.empty() ? QString("loadParams: invalid file")
                               : QString::fromStdString(errors.front()));
    return;
  }

  SweepInput in;
  in.principal  = p->principal;
  in.creditRate = p->credit_rate;
  in.inflation  = p->inflation_rate;
  in.withBudget = p->has_budget();
  in.acceptable = p->acceptable_payment.value_or(0.0);
  in.investRate = p->investment_rate.value_or(0.0);
  qDebug() << "[Sweep] params loaded from" << path << "budget=" << in.withBudget;
  emit paramsLoaded(in);
  emit message("Paramètres chargés.");
}

void SweepWorker::runSweep(gui::SweepInput in) {
  try {
    std::optional<lb::config::LoanParameters> p;
    if (in.withBudget) {
      p.emplace(in.principal, in.creditRate, in.inflation, in.acceptable, in.investRate);
    } else {
      p.emplace(in.principal, in.creditRate, in.inflation);
    }

    using lb::sweep::SweepMode;
    lb::sweep::TermResults plain = lb::sweep::run_sweep(*p, SweepMode::Plain);
    lb::sweep::TermResults over, invest;
    if (lb::sweep::mode_available(*p, SweepMode::Overpayment)) {
      over = lb::sweep::run_sweep(*p, SweepMode::Overpayment);
    }
    if (lb::sweep::mode_available(*p, SweepMode::InvestSurplus)) {
      invest = lb::sweep::run_sweep(*p, SweepMode::InvestSurplus);
    }
    qDebug() << "[Sweep] done: plain=" << plain.size()
             << "overpayment=" << over.size() << "invest=" << invest.size();
    emit sweepFinished(plain, over, invest, in.withBudget ? in.acceptable : -1.0);
  } catch (const std::exception& e) {
    emit failed(QString("runSweep: %1").arg(e.what()));
  }
}
