#pragma once
/**
 * @file money.hpp
 * @brief Arrondi monétaire (au centime) des résultats financiers.
 *
 * Les montants affichés à l'utilisateur sont exprimés avec 2 décimales.
 * L'arrondi se fait **une seule fois**, au moment où un montant est stocké
 * dans un résultat (jamais sur des valeurs intermédiaires).
 */

namespace lb {
namespace core {

/// Écart en dessous duquel un solde restant est considéré comme soldé.
inline constexpr double kCentEpsilon = 0.01;

/// @brief Arrondit un montant au centime le plus proche (demi-valeurs loin de zéro).
/// @note NaN et ±inf sont renvoyés tels quels.
[[nodiscard]] double round_cents(double amount) noexcept;

} // namespace core
} // namespace lb
