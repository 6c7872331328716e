#include <lb/core/money.hpp>

#include <cmath>   // std::round, std::isfinite

namespace lb {
namespace core {

double round_cents(double amount) noexcept {
  if (!std::isfinite(amount)) {
    return amount;
  }
  const double r = std::round(amount * 100.0) / 100.0;
  return (r == 0.0) ? 0.0 : r; // pas de -0.00 à l'affichage
}

} // namespace core
} // namespace lb
