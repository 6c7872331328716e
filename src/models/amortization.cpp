#include <lb/models/amortization.hpp>
#include <lb/models/investment.hpp>
#include <lb/core/money.hpp>

#include <cmath>       // std::pow
#include <stdexcept>   // std::invalid_argument
#include <string>

namespace lb {
namespace models {

namespace {

void check_loan(const char* fn, double principal, double monthly_rate, int term_years) {
  if (!(principal >= 0.0)) {
    throw std::invalid_argument(std::string(fn) + ": principal must be >= 0");
  }
  if (!(monthly_rate >= 0.0)) {
    throw std::invalid_argument(std::string(fn) + ": monthly rate must be >= 0");
  }
  if (term_years <= 0) {
    throw std::invalid_argument(std::string(fn) + ": term must be > 0 years");
  }
}

// Annuité constante (non arrondie)
double annuity_payment(double principal, double monthly_rate, int months) {
  if (monthly_rate == 0.0) {
    return principal / static_cast<double>(months);
  }
  const double f = std::pow(1.0 + monthly_rate, months);
  return principal * (monthly_rate * f) / (f - 1.0);
}

} // namespace

StandardTerm compute_standard_term(double principal, double monthly_rate, int term_years) {
  check_loan("compute_standard_term", principal, monthly_rate, term_years);

  const int months = term_years * 12;
  const double payment = annuity_payment(principal, monthly_rate, months);
  return { core::round_cents(payment), core::round_cents(payment * months) };
}

OverpaymentTerm compute_overpayment_term(double principal,
                                         double monthly_rate,
                                         int term_years,
                                         double acceptable_payment,
                                         double investment_rate_percent) {
  check_loan("compute_overpayment_term", principal, monthly_rate, term_years);
  if (!(acceptable_payment >= 0.0)) {
    throw std::invalid_argument("compute_overpayment_term: acceptable payment must be >= 0");
  }
  if (!(investment_rate_percent >= 0.0)) {
    throw std::invalid_argument("compute_overpayment_term: investment rate must be >= 0");
  }

  const int total_months = term_years * 12;
  const StandardTerm standard = compute_standard_term(principal, monthly_rate, term_years);

  // Budget <= obligation : rien ne change
  if (acceptable_payment <= standard.monthly_payment) {
    return { standard.monthly_payment, standard.total_cost, 0.0, total_months };
  }

  double remaining = principal;
  double total_paid = 0.0;
  int elapsed = 0;
  while (remaining > core::kCentEpsilon && elapsed < total_months) {
    const double interest = remaining * monthly_rate;
    const double amortized = acceptable_payment - interest;
    if (amortized <= 0.0) {
      break; // la mensualité ne couvre même pas les intérêts
    }
    remaining -= amortized;
    total_paid += acceptable_payment;
    ++elapsed;
  }
  // Budget sous l'annuité exacte (écart d'arrondi) : le crédit n'est pas soldé,
  // l'échéancier standard s'applique
  if (remaining > core::kCentEpsilon) {
    return { standard.monthly_payment, standard.total_cost, 0.0, total_months };
  }

  // Budget libéré après remboursement : placé jusqu'au terme nominal
  double investment = 0.0;
  const int remaining_months = total_months - elapsed;
  if (remaining_months > 0) {
    investment = compute_balance(0.0, acceptable_payment, investment_rate_percent,
                                 static_cast<double>(remaining_months) / 12.0);
  }

  return { core::round_cents(acceptable_payment),
           core::round_cents(total_paid - investment),
           investment,
           elapsed };
}

} // namespace models
} // namespace lb
