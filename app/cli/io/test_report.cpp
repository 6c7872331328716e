#include "lb/io/report.hpp"
#include <cassert>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
using namespace std;

static size_t count_lines(const string& s) {
  size_t n = 0;
  for (char c : s) if (c == '\n') ++n;
  return n;
}

int main() {
  using lb::sweep::SweepMode;
  const lb::config::LoanParameters p(100000, 6.0, 0.0, 3000.0, 4.0);

  // Paramètres : noms des clés du fichier
  {
    ostringstream os;
    lb::io::print_parameters(os, p);
    const string s = os.str();
    assert(s.find("Credit amount: 100000") != string::npos);
    assert(s.find("Acceptable monthly payment: 3000") != string::npos);
    assert(count_lines(s) == 5);
  }

  // Montants élevés : pas de notation scientifique, flux restauré
  {
    const lb::config::LoanParameters big(1000000, 3.125, -0.5, 12500.5, 4.0);
    ostringstream os;
    lb::io::print_parameters(os, big);
    const string s = os.str();
    assert(s.find("Credit amount: 1000000.00\n") != string::npos);
    assert(s.find("e+") == string::npos);
    assert(s.find("Credit rate: 3.125\n") != string::npos);
    assert(s.find("Expected inflation: -0.5\n") != string::npos);
    assert(s.find("Acceptable monthly payment: 12500.50\n") != string::npos);
    assert(!(os.flags() & std::ios::fixed));
  }

  // Résultats plain : 28 lignes, 2 décimales
  {
    ostringstream os;
    os << std::setprecision(3);
    lb::io::print_results(os, lb::sweep::sweep_plain(p), SweepMode::Plain);
    const string s = os.str();
    assert(count_lines(s) == 28);
    assert(s.find("10 years: Monthly payment: 1110.21, Total cost: 133224.60") != string::npos);
    assert(s.find("Investment balance") == string::npos);
    // format du flux restauré
    assert(os.precision() == 3);
    assert(!(os.flags() & std::ios::fixed));
  }

  // Overpayment : mois de remboursement affiché
  {
    ostringstream os;
    lb::io::print_results(os, lb::sweep::sweep_overpayment(p), SweepMode::Overpayment);
    assert(os.str().find("Paid off after") != string::npos);
    assert(os.str().find("Investment balance") != string::npos);
  }

  // CSV : en-tête + 28 lignes
  {
    ostringstream os;
    lb::io::write_results_csv(os, lb::sweep::sweep_plain(p));
    const string s = os.str();
    assert(s.rfind("years,monthly_payment,total_cost,total_cost_adjusted,investment_balance,months_to_payoff\n", 0) == 0);
    assert(count_lines(s) == 29);
    assert(s.find("\n10,1110.21,133224.60,133224.60,0.00,120\n") != string::npos);
  }

  // Fichier inaccessible
  {
    string err;
    assert(!lb::io::save_results_csv("no_such_dir/out.csv", lb::sweep::sweep_plain(p), &err));
    assert(err.find("Cannot open CSV file") != string::npos);
  }

  cout << "report OK\n";
  return 0;
}
