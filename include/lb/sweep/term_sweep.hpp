#pragma once
/**
 * @file term_sweep.hpp
 * @brief Balayage des durées de crédit 3..30 ans pour trois modes de calcul.
 *
 * # Modes
 * - Plain         : échéancier standard ; investment_balance toujours 0.
 * - Overpayment   : mensualité acceptable versée dès le départ, remboursement
 *                   anticipé puis placement du budget libéré jusqu'au terme.
 * - InvestSurplus : échéancier standard ; l'écart (acceptable - requise), s'il est
 *                   positif, est placé chaque mois sur toute la durée.
 *
 * # Conventions
 * - Clés du résultat : exactement 3..30, ordre croissant (std::map).
 * - L'horizon d'actualisation par l'inflation est TOUJOURS la durée nominale
 *   (la clé `years`), y compris en mode Overpayment.
 * - Tous les montants sont arrondis au centime au moment du stockage.
 * - Chaque durée est calculée indépendamment à partir des paramètres seuls.
 */

#include <map>
#include <lb/config/loan_params.hpp>

namespace lb {
namespace sweep {

inline constexpr int kMinTermYears = 3;
inline constexpr int kMaxTermYears = 30;

/// @brief Résultat pour une durée donnée. Jamais modifié après création.
struct TermResult {
  double monthly_payment;     ///< Mensualité effectivement versée.
  double total_cost;          ///< Coût total nominal (net du placement le cas échéant).
  double total_cost_adjusted; ///< Coût total en monnaie d'aujourd'hui.
  double investment_balance;  ///< Solde du placement au terme (0 si non applicable).
  int    months_to_payoff;    ///< Mois jusqu'au remboursement (years*12 hors Overpayment).
};

/// Durée (années) → résultat.
using TermResults = std::map<int, TermResult>;

enum class SweepMode { Plain, Overpayment, InvestSurplus };

/// @return Nom court du mode ("plain", "overpayment", "invest-surplus").
const char* to_string(SweepMode mode) noexcept;

/// @brief Convertit un nom court en mode. @return false si inconnu.
bool parse_mode(const char* name, SweepMode& out) noexcept;

/// @return true si les paramètres permettent ce mode (budget requis hors Plain).
bool mode_available(const config::LoanParameters& p, SweepMode mode) noexcept;

/// @brief Échéancier standard pour chaque durée.
TermResults sweep_plain(const config::LoanParameters& p);

/// @brief Remboursement anticipé pour chaque durée.
/// @throws std::invalid_argument si le budget (mensualité/taux de placement) manque.
TermResults sweep_overpayment(const config::LoanParameters& p);

/// @brief Crédit standard + placement du surplus mensuel pour chaque durée.
/// @throws std::invalid_argument si le budget (mensualité/taux de placement) manque.
TermResults sweep_invest_surplus(const config::LoanParameters& p);

/**
 * @brief Solde obtenu en plaçant (acceptable - requise) chaque mois, durée par durée.
 *
 * Seules les durées dont la mensualité standard est <= mensualité acceptable
 * figurent dans le résultat. Sert d'indicateur à côté des résultats Plain.
 * @param plain Résultats de sweep_plain(p).
 * @throws std::invalid_argument si le budget manque.
 */
std::map<int, double> surplus_balances(const config::LoanParameters& p, const TermResults& plain);

/// @brief Dispatch selon le mode.
TermResults run_sweep(const config::LoanParameters& p, SweepMode mode);

} // namespace sweep
} // namespace lb
