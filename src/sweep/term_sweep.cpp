#include <lb/sweep/term_sweep.hpp>
#include <lb/models/amortization.hpp>
#include <lb/models/investment.hpp>
#include <lb/adjust/inflation.hpp>
#include <lb/core/money.hpp>

#include <algorithm>   // std::max
#include <cstring>     // std::strcmp
#include <stdexcept>   // std::invalid_argument
#include <string>

namespace lb {
namespace sweep {

namespace {

void require_budget(const config::LoanParameters& p, const char* fn) {
  if (!p.has_budget()) {
    throw std::invalid_argument(std::string(fn) +
        ": acceptable monthly payment and investment rate are required");
  }
}

TermResult make_result(double payment, double total_cost, double investment,
                       int months, double inflation_percent, int years) {
  const double adjusted = adjust::adjust_for_inflation(total_cost, inflation_percent, years);
  return { core::round_cents(payment),
           core::round_cents(total_cost),
           core::round_cents(adjusted),
           core::round_cents(investment),
           months };
}

} // namespace

const char* to_string(SweepMode mode) noexcept {
  switch (mode) {
    case SweepMode::Plain:         return "plain";
    case SweepMode::Overpayment:   return "overpayment";
    case SweepMode::InvestSurplus: return "invest-surplus";
  }
  return "unknown";
}

bool parse_mode(const char* name, SweepMode& out) noexcept {
  if (!name) return false;
  for (SweepMode m : {SweepMode::Plain, SweepMode::Overpayment, SweepMode::InvestSurplus}) {
    if (std::strcmp(name, to_string(m)) == 0) { out = m; return true; }
  }
  return false;
}

bool mode_available(const config::LoanParameters& p, SweepMode mode) noexcept {
  return mode == SweepMode::Plain || p.has_budget();
}

TermResults sweep_plain(const config::LoanParameters& p) {
  TermResults out;
  const double i = p.monthly_rate();
  for (int years = kMinTermYears; years <= kMaxTermYears; ++years) {
    const auto st = models::compute_standard_term(p.principal, i, years);
    out.emplace(years, make_result(st.monthly_payment, st.total_cost, 0.0,
                                   years * 12, p.inflation_rate, years));
  }
  return out;
}

TermResults sweep_overpayment(const config::LoanParameters& p) {
  require_budget(p, "sweep_overpayment");
  TermResults out;
  const double i = p.monthly_rate();
  for (int years = kMinTermYears; years <= kMaxTermYears; ++years) {
    const auto op = models::compute_overpayment_term(p.principal, i, years,
                                                     *p.acceptable_payment,
                                                     *p.investment_rate);
    // horizon d'actualisation : durée nominale
    out.emplace(years, make_result(op.monthly_payment, op.total_cost, op.investment_balance,
                                   op.months_to_payoff, p.inflation_rate, years));
  }
  return out;
}

TermResults sweep_invest_surplus(const config::LoanParameters& p) {
  require_budget(p, "sweep_invest_surplus");
  TermResults out;
  const double i = p.monthly_rate();
  const double acceptable = *p.acceptable_payment;
  for (int years = kMinTermYears; years <= kMaxTermYears; ++years) {
    const auto st = models::compute_standard_term(p.principal, i, years);
    const double payment = std::max(acceptable, st.monthly_payment);
    const double surplus = std::max(0.0, acceptable - st.monthly_payment);

    // pas de remboursement anticipé ici : le placement court sur toute la durée
    const double balance = models::compute_balance(0.0, surplus, *p.investment_rate, years);
    out.emplace(years, make_result(payment, st.total_cost - balance, balance,
                                   years * 12, p.inflation_rate, years));
  }
  return out;
}

std::map<int, double> surplus_balances(const config::LoanParameters& p, const TermResults& plain) {
  require_budget(p, "surplus_balances");
  std::map<int, double> out;
  const double acceptable = *p.acceptable_payment;
  for (const auto& [years, r] : plain) {
    if (acceptable >= r.monthly_payment) {
      out.emplace(years, models::compute_balance(0.0, acceptable - r.monthly_payment,
                                                 *p.investment_rate, years));
    }
  }
  return out;
}

TermResults run_sweep(const config::LoanParameters& p, SweepMode mode) {
  switch (mode) {
    case SweepMode::Plain:         return sweep_plain(p);
    case SweepMode::Overpayment:   return sweep_overpayment(p);
    case SweepMode::InvestSurplus: return sweep_invest_surplus(p);
  }
  throw std::invalid_argument("run_sweep: unknown mode");
}

} // namespace sweep
} // namespace lb
