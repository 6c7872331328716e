#pragma once
#include <optional>
#include <string>
#include <vector>

#include <lb/config/loan_params.hpp>

namespace lb::io {

// Clés du fichier de paramètres.
inline constexpr const char* kKeyCreditAmount      = "Credit amount";
inline constexpr const char* kKeyCreditRate        = "Credit rate";
inline constexpr const char* kKeyExpectedInflation = "Expected inflation";
inline constexpr const char* kKeyAcceptablePayment = "Acceptable monthly payment";
inline constexpr const char* kKeyInvestmentRate    = "Investment interest rate";

// Chemin par défaut du fichier d'entrée (relatif au répertoire courant).
inline constexpr const char* kDefaultInputPath = "data/default_input.json";

// Valide et convertit un document JSON (texte) en paramètres.
// Requis : "Credit amount" (nombre), "Credit rate" et "Expected inflation"
// (tableaux non vides). Optionnels : "Acceptable monthly payment",
// "Investment interest rate". Seule la 1re valeur d'un tableau est utilisée.
// Retourne std::nullopt si invalide ; les raisons sont ajoutées à *errors.
// Les remarques non bloquantes (valeurs ignorées) vont dans *warnings.
std::optional<config::LoanParameters>
parse_params_json(const std::string& json_text,
                  std::vector<std::string>* errors = nullptr,
                  std::vector<std::string>* warnings = nullptr);

// Lit un fichier de paramètres. Refuse un chemin contenant ".." après normalisation.
std::optional<config::LoanParameters>
read_params_json(const std::string& path,
                 std::vector<std::string>* errors = nullptr,
                 std::vector<std::string>* warnings = nullptr);

// Écrit un fichier d'exemple (600000, [8.0], [3.0], [6000], [5.0]).
bool write_sample_params_json(const std::string& path, std::string* error = nullptr);

} // namespace lb::io
