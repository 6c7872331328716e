#include <lb/models/investment.hpp>
#include <lb/core/money.hpp>

#include <cmath>       // std::pow, std::isfinite
#include <stdexcept>   // std::invalid_argument

namespace lb {
namespace models {

double compute_balance(double initial_amount,
                       double monthly_contribution,
                       double annual_rate_percent,
                       double years) {
  // NaN échoue aussi aux comparaisons ci-dessous (>= 0 faux)
  if (!(initial_amount >= 0.0)) {
    throw std::invalid_argument("compute_balance: initial amount must be >= 0");
  }
  if (!(monthly_contribution >= 0.0)) {
    throw std::invalid_argument("compute_balance: monthly contribution must be >= 0");
  }
  if (!(annual_rate_percent >= 0.0)) {
    throw std::invalid_argument("compute_balance: interest rate must be >= 0");
  }
  if (!(years > 0.0)) {
    throw std::invalid_argument("compute_balance: years must be > 0");
  }

  const double r = annual_rate_percent / 100.0 / 12.0;
  const double n = years * 12.0;
  const double growth = std::pow(1.0 + r, n);

  const double lump_fv = initial_amount * growth;
  const double annuity_fv = (r == 0.0)
      ? monthly_contribution * n
      : monthly_contribution * ((growth - 1.0) / r);

  return core::round_cents(lump_fv + annuity_fv);
}

} // namespace models
} // namespace lb
