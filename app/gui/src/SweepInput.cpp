#include "SweepInput.hpp"

#include <algorithm>
#include <cmath>

namespace gui {

namespace {
bool differs(double a, double b) {
  return std::abs(a - b) > 1e-9 * std::max(1.0, std::abs(a));
}
}

QStringList adjustedFields(const SweepInput& loaded, const SweepInput& shown) {
  QStringList out;
  if (differs(loaded.principal,  shown.principal))  out << "Credit amount";
  if (differs(loaded.creditRate, shown.creditRate)) out << "Credit rate";
  if (differs(loaded.inflation,  shown.inflation))  out << "Expected inflation";
  if (loaded.withBudget) {
    if (differs(loaded.acceptable, shown.acceptable)) out << "Acceptable monthly payment";
    if (differs(loaded.investRate, shown.investRate)) out << "Investment interest rate";
  }
  return out;
}

} // namespace gui
