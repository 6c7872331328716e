#pragma once
#include <QObject>
#include <QString>

#include <lb/sweep/term_sweep.hpp>

#include "SweepInput.hpp"

namespace gui {

class SweepWorker : public QObject {
  Q_OBJECT
public:
  explicit SweepWorker(QObject* parent = nullptr);

public slots:
  // Lit un fichier JSON de paramètres et renvoie les valeurs à l'UI.
  void loadParams(const QString& path);
  // Calcule les modes disponibles (plain toujours ; overpayment / invest-surplus si budget).
  void runSweep(gui::SweepInput in);

signals:
  void message(const QString& text);
  void paramsLoaded(gui::SweepInput in);
  void sweepFinished(lb::sweep::TermResults plain,
                     lb::sweep::TermResults overpayment,
                     lb::sweep::TermResults investSurplus,
                     double acceptable);
  void failed(const QString& why);
};

} // namespace gui
