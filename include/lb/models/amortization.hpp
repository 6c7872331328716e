#pragma once
/**
 * @file amortization.hpp
 * @brief Crédit amortissable à taux fixe : échéancier standard et remboursement anticipé.
 *
 * # Échéancier standard (annuité constante)
 * Avec i = taux mensuel décimal et n = années * 12 :
 *    i == 0 : M = P / n                         (remboursement linéaire)
 *    sinon  : M = P * i (1+i)^n / ((1+i)^n - 1)
 *    coût total = M * n
 * M et le coût total sont arrondis au centime une fois calculés (le coût
 * part de M non arrondi : à taux nul, coût total = P).
 *
 * # Remboursement anticipé (mensualité "acceptable" A > M)
 * Simulation mois par mois, bornée par n :
 *    intérêts   = solde * i
 *    amortissement = A - intérêts   (<= 0 ⇒ arrêt : A ne couvre pas les intérêts)
 *    solde     -= amortissement ; payé += A
 * Arrêt dès que solde <= 0.01 (epsilon centime) ou après n mois.
 * Les mois restants jusqu'au terme nominal, A est placé au taux de
 * placement (cf. lb::models::compute_balance) ; coût total = payé - placement.
 *
 * Si A <= M (M arrondi), ou si la simulation ne solde pas le crédit
 * (A entre M arrondi et M exact), on renvoie l'échéancier standard
 * (placement nul, n mois).
 */

namespace lb {
namespace models {

/// @brief Échéancier standard (montants au centime).
struct StandardTerm {
  double monthly_payment; ///< Mensualité M.
  double total_cost;      ///< M * n.
};

/// @brief Résultat d'un remboursement anticipé à mensualité acceptable.
struct OverpaymentTerm {
  double monthly_payment;    ///< A si remboursement anticipé, sinon M.
  double total_cost;         ///< Total payé - solde du placement (peut être < 0).
  double investment_balance; ///< Solde du placement au terme nominal (0 si non applicable).
  int    months_to_payoff;   ///< Mois effectivement remboursés (<= n).
};

/**
 * @brief Mensualité et coût total pour une durée donnée.
 * @param principal    Montant emprunté (>= 0).
 * @param monthly_rate Taux mensuel décimal (>= 0).
 * @param term_years   Durée en années (> 0).
 * @throws std::invalid_argument si un argument est hors domaine.
 */
[[nodiscard]] StandardTerm compute_standard_term(double principal,
                                                 double monthly_rate,
                                                 int term_years);

/**
 * @brief Remboursement anticipé avec une mensualité acceptable fixe.
 * @param principal               Montant emprunté (>= 0).
 * @param monthly_rate            Taux mensuel décimal (>= 0).
 * @param term_years              Durée nominale en années (> 0).
 * @param acceptable_payment      Mensualité du budget (>= 0).
 * @param investment_rate_percent Rendement annuel du placement, en pourcent (>= 0).
 * @throws std::invalid_argument si un argument est hors domaine.
 */
[[nodiscard]] OverpaymentTerm compute_overpayment_term(double principal,
                                                       double monthly_rate,
                                                       int term_years,
                                                       double acceptable_payment,
                                                       double investment_rate_percent);

} // namespace models
} // namespace lb
