#pragma once
#include <QStringList>

namespace gui {

// Paramètres saisis dans l'UI (passés par valeur en queued connection).
struct SweepInput {
  double principal{0.0};
  double creditRate{0.0};
  double inflation{0.0};
  bool   withBudget{false};
  double acceptable{0.0};
  double investRate{0.0};
};

// Champs dont la valeur affichée diffère de la valeur chargée
// (bornes ou nombre de décimales des spin boxes). Libellés = clés du fichier.
QStringList adjustedFields(const SweepInput& loaded, const SweepInput& shown);

} // namespace gui
