#pragma once
/**
 * @file loan_params.hpp
 * @brief Paramètres d'un balayage de durées de crédit.
 *
 * # Contenu
 * - principal         : montant emprunté (>= 0).
 * - credit_rate       : taux nominal annuel en POURCENT (>= 0, ex : 6.0 pour 6 %).
 * - inflation_rate    : inflation annuelle attendue en POURCENT (peut être < 0).
 * - acceptable_payment: mensualité "acceptable" du budget (optionnelle, >= 0).
 * - investment_rate   : rendement annuel du placement en POURCENT (optionnel, >= 0).
 *
 * # Modes disponibles
 * Sans acceptable_payment ET investment_rate, seuls les résultats "plain"
 * peuvent être calculés (cf. lb::sweep::mode_available).
 *
 * Immuables après construction.
 */

#include <optional>
#include <stdexcept> // std::invalid_argument

namespace lb {
namespace config {

struct LoanParameters {
public:
  const double principal;                          ///< Montant emprunté.
  const double credit_rate;                        ///< Taux annuel (%).
  const double inflation_rate;                     ///< Inflation annuelle (%).
  const std::optional<double> acceptable_payment;  ///< Mensualité acceptable.
  const std::optional<double> investment_rate;     ///< Rendement annuel du placement (%).

  /// @brief Construit un jeu de paramètres valide.
  /// @throws std::invalid_argument si un montant/taux est négatif ou non fini
  ///         (l'inflation peut être négative mais doit être finie).
  LoanParameters(double principal,
                 double credit_rate,
                 double inflation_rate,
                 std::optional<double> acceptable_payment = std::nullopt,
                 std::optional<double> investment_rate = std::nullopt);

  /// @return Taux mensuel décimal (credit_rate / 100 / 12).
  double monthly_rate() const noexcept { return credit_rate / 100.0 / 12.0; }

  /// @return true si mensualité acceptable et taux de placement sont renseignés.
  bool has_budget() const noexcept {
    return acceptable_payment.has_value() && investment_rate.has_value();
  }
};

} // namespace config
} // namespace lb
