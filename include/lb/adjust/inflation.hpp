#pragma once
/**
 * @file inflation.hpp
 * @brief Coût exprimé en monnaie "d'aujourd'hui" (actualisation par l'inflation).
 *
 *   coût_ajusté = coût_nominal / (1 + inflation/100)^années
 *
 * - Inflation négative (déflation) autorisée : le coût ajusté dépasse alors le nominal.
 * - Aucun arrondi ici : l'arrondi au centime se fait une seule fois, au stockage
 *   dans le résultat (évite le double arrondi).
 */

namespace lb {
namespace adjust {

/// @brief Actualise un coût nominal sur `years` années.
/// @param nominal_cost            Coût nominal (peut être négatif : gain net).
/// @param annual_inflation_percent Inflation annuelle en pourcent (> -100).
/// @param years                   Horizon en années.
[[nodiscard]] double adjust_for_inflation(double nominal_cost,
                                          double annual_inflation_percent,
                                          double years) noexcept;

/// @return Facteur (1 + inflation/100)^years.
[[nodiscard]] double inflation_factor(double annual_inflation_percent, double years) noexcept;

} // namespace adjust
} // namespace lb
