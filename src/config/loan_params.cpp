#include <lb/config/loan_params.hpp>

#include <cmath>   // std::isfinite
#include <string>

namespace lb {
namespace config {

namespace {

void require_non_negative(double v, const char* what) {
  if (!std::isfinite(v) || v < 0.0) {
    throw std::invalid_argument(std::string("LoanParameters: ") + what + " must be finite and >= 0");
  }
}

} // namespace

LoanParameters::LoanParameters(double principal,
                               double credit_rate,
                               double inflation_rate,
                               std::optional<double> acceptable_payment,
                               std::optional<double> investment_rate)
    : principal(principal),
      credit_rate(credit_rate),
      inflation_rate(inflation_rate),
      acceptable_payment(acceptable_payment),
      investment_rate(investment_rate) {
  require_non_negative(principal, "principal");
  require_non_negative(credit_rate, "credit rate");
  if (!std::isfinite(inflation_rate) || inflation_rate <= -100.0) {
    throw std::invalid_argument("LoanParameters: inflation rate must be finite and > -100");
  }
  if (acceptable_payment) require_non_negative(*acceptable_payment, "acceptable payment");
  if (investment_rate)    require_non_negative(*investment_rate, "investment rate");
}

} // namespace config
} // namespace lb
