#include <lb/models/investment.hpp>
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

static bool throws_invalid(double i, double c, double r, double y) {
  try {
    (void)lb::models::compute_balance(i, c, r, y);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

int main() {
  using lb::models::compute_balance;
  constexpr double EPS = 1e-9;

  // 1) Annuité pure : 1000/mois, 6 %, 10 ans
  assert(std::abs(compute_balance(0, 1000, 6.0, 10) - 163879.35) < EPS);

  // 2) Taux nul : capital + versements
  assert(compute_balance(10000, 500, 0.0, 5) == 10000.0 + 500.0 * 5 * 12);

  // 3) Capital seul
  const double lump = 50000 * std::pow(1 + 0.05 / 12, 120);
  assert(std::abs(compute_balance(50000, 0, 5.0, 10) - std::round(lump * 100) / 100) < EPS);

  // 4) Formule complète (capital + annuité)
  {
    const double r = 0.06 / 12, g = std::pow(1 + r, 60);
    const double expected = std::round((10000 * g + 500 * ((g - 1) / r)) * 100) / 100;
    assert(std::abs(compute_balance(10000, 500, 6.0, 5) - expected) < EPS);
  }

  // 5) Années fractionnaires : 6 mois à taux nul = 6 versements
  assert(compute_balance(0, 100, 0.0, 0.5) == 600.0);

  // 6) Monotonie : taux, durée, versement
  assert(compute_balance(10000, 500, 3.0, 10) < compute_balance(10000, 500, 8.0, 10));
  assert(compute_balance(10000, 500, 6.0, 5)  < compute_balance(10000, 500, 6.0, 15));
  assert(compute_balance(10000, 300, 6.0, 10) < compute_balance(10000, 800, 6.0, 10));

  // 7) Effet composé : 2e année > 1re année
  {
    const double y1 = compute_balance(10000, 0, 10.0, 1);
    const double y2 = compute_balance(10000, 0, 10.0, 2);
    assert((y2 - y1) > (y1 - 10000));
  }

  // 8) Résultat au centime
  {
    const double v = compute_balance(10000.123, 500.456, 6.789, 5);
    assert(std::abs(v * 100 - std::round(v * 100)) < 1e-6);
  }

  // 9) Préconditions : rejet, pas de clamp
  assert(throws_invalid(-1, 0, 5, 1));
  assert(throws_invalid(0, -1, 5, 1));
  assert(throws_invalid(0, 0, -0.5, 1));
  assert(throws_invalid(0, 0, 5, 0));
  assert(throws_invalid(0, 0, 5, -2));
  assert(throws_invalid(std::nan(""), 0, 5, 1));
  assert(!throws_invalid(0, 0, 0, 1));

  std::cout << "investment OK\n";
  return 0;
}
