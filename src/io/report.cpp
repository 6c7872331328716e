#include "lb/io/report.hpp"
#include <fstream>
#include <iomanip>

namespace {

// Restaure le format du flux en sortie de scope
struct FixedFormat {
  std::ostream& os;
  std::ios_base::fmtflags flags;
  std::streamsize prec;
  explicit FixedFormat(std::ostream& o, int p)
    : os(o), flags(o.flags()), prec(o.precision()) {
    os.setf(std::ios::fixed, std::ios::floatfield);
    os << std::setprecision(p);
  }
  ~FixedFormat() { os.flags(flags); os.precision(prec); }
};

} // namespace

namespace lb::io {

void print_parameters(std::ostream& os, const config::LoanParameters& p) {
  // montants au centime, taux en pourcentage tels que saisis
  {
    FixedFormat fmt(os, 2);
    os << "Credit amount: " << p.principal << "\n";
  }
  os << "Credit rate: " << p.credit_rate << "\n"
     << "Expected inflation: " << p.inflation_rate << "\n";
  if (p.acceptable_payment) {
    FixedFormat fmt(os, 2);
    os << "Acceptable monthly payment: " << *p.acceptable_payment << "\n";
  }
  if (p.investment_rate) os << "Investment interest rate: " << *p.investment_rate << "\n";
}

void print_results(std::ostream& os, const sweep::TermResults& results, sweep::SweepMode mode) {
  FixedFormat fmt(os, 2);
  for (const auto& [years, r] : results) {
    os << std::setw(2) << years << " years: "
       << "Monthly payment: " << r.monthly_payment
       << ", Total cost: " << r.total_cost
       << ", Inflation-adjusted cost: " << r.total_cost_adjusted;
    if (mode != sweep::SweepMode::Plain) {
      os << ", Investment balance: " << r.investment_balance;
    }
    if (mode == sweep::SweepMode::Overpayment && r.months_to_payoff < years * 12) {
      os << ", Paid off after " << r.months_to_payoff << " months";
    }
    os << "\n";
  }
}

void print_surplus_balances(std::ostream& os, const std::map<int, double>& balances) {
  FixedFormat fmt(os, 2);
  for (const auto& [years, b] : balances) {
    os << "  Investment account balance after " << years << " years: " << b << "\n";
  }
}

void write_results_csv(std::ostream& os, const sweep::TermResults& results) {
  FixedFormat fmt(os, 2);
  os << "years,monthly_payment,total_cost,total_cost_adjusted,investment_balance,months_to_payoff\n";
  for (const auto& [years, r] : results) {
    os << years << ',' << r.monthly_payment << ',' << r.total_cost << ','
       << r.total_cost_adjusted << ',' << r.investment_balance << ','
       << r.months_to_payoff << '\n';
  }
}

bool save_results_csv(const std::string& path,
                      const sweep::TermResults& results,
                      std::string* error) {
  std::ofstream ofs(path);
  if (!ofs) {
    if (error) *error = "Cannot open CSV file: " + path;
    return false;
  }
  write_results_csv(ofs, results);
  return static_cast<bool>(ofs);
}

} // namespace lb::io
