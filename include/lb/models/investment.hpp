#pragma once
/**
 * @file investment.hpp
 * @brief Compte de placement : capital initial + versements mensuels à taux fixe.
 *
 * # Formules
 * Avec r = taux_annuel / 100 / 12 et n = années * 12 (n réel, pas tronqué) :
 *   - capital initial : V0 * (1 + r)^n
 *   - versements en fin de mois (annuité ordinaire) :
 *       r == 0 : c * n
 *       sinon  : c * ((1 + r)^n - 1) / r
 * Le solde final est la somme des deux, arrondie au centime.
 *
 * # Préconditions
 * initial >= 0, contribution >= 0, taux >= 0, années > 0.
 * Une violation est une erreur de l'appelant : std::invalid_argument
 * (pas de clamp silencieux).
 */

namespace lb {
namespace models {

/**
 * @brief Solde final d'un placement alimenté chaque mois.
 * @param initial_amount       Capital placé au départ (>= 0).
 * @param monthly_contribution Versement de fin de mois (>= 0).
 * @param annual_rate_percent  Rendement annuel en pourcent (>= 0).
 * @param years                Horizon en années, fractionnaire autorisé (> 0).
 * @return Solde arrondi au centime.
 * @throws std::invalid_argument si une précondition est violée.
 */
[[nodiscard]] double compute_balance(double initial_amount,
                                     double monthly_contribution,
                                     double annual_rate_percent,
                                     double years);

} // namespace models
} // namespace lb
