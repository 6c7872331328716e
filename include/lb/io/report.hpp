#pragma once
#include <map>
#include <ostream>
#include <string>

#include <lb/config/loan_params.hpp>
#include <lb/sweep/term_sweep.hpp>

namespace lb::io {

// Affiche les paramètres d'entrée, une ligne par clé (noms du fichier JSON).
void print_parameters(std::ostream& os, const config::LoanParameters& p);

// Une ligne par durée, montants à 2 décimales.
// Le mode Overpayment affiche en plus le mois de remboursement.
void print_results(std::ostream& os, const sweep::TermResults& results, sweep::SweepMode mode);

// Soldes du placement du surplus (cf. sweep::surplus_balances).
void print_surplus_balances(std::ostream& os, const std::map<int, double>& balances);

// En-tête: years,monthly_payment,total_cost,total_cost_adjusted,investment_balance,months_to_payoff
void write_results_csv(std::ostream& os, const sweep::TermResults& results);

// Écrit le CSV dans un fichier. Retourne false (et renseigne *error) si le fichier
// ne peut pas être ouvert.
bool save_results_csv(const std::string& path,
                      const sweep::TermResults& results,
                      std::string* error = nullptr);

} // namespace lb::io
