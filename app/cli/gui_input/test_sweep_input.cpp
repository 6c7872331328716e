#include "SweepInput.hpp"
#include <cassert>
#include <iostream>

int main() {
  gui::SweepInput loaded;
  loaded.principal  = 2.5e12;
  loaded.creditRate = 3.12345;
  loaded.inflation  = -60.0;
  loaded.withBudget = true;
  loaded.acceptable = 6000.0;
  loaded.investRate = 5.0;

  // Valeurs identiques : rien à signaler
  assert(gui::adjustedFields(loaded, loaded).isEmpty());

  // Bornée / arrondie par le formulaire
  gui::SweepInput shown = loaded;
  shown.principal  = 1e12;
  shown.creditRate = 3.1235;
  const QStringList f = gui::adjustedFields(loaded, shown);
  assert(f.size() == 2);
  assert(f.contains("Credit amount"));
  assert(f.contains("Credit rate"));

  // Budget désactivé : champs budget ignorés
  gui::SweepInput noBudget = loaded;
  noBudget.withBudget = false;
  gui::SweepInput shownNoBudget = noBudget;
  shownNoBudget.acceptable = 0.0;
  shownNoBudget.investRate = 0.0;
  assert(gui::adjustedFields(noBudget, shownNoBudget).isEmpty());

  // Budget actif : écart détecté
  shown = loaded;
  shown.investRate = 4.0;
  assert(gui::adjustedFields(loaded, shown) == QStringList{"Investment interest rate"});

  std::cout << "sweep input OK\n";
  return 0;
}
