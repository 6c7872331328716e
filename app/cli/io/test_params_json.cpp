#include "lb/io/params_json.hpp"
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
using namespace std;

static bool has(const vector<string>& v, const string& needle) {
  return any_of(v.begin(), v.end(), [&](const string& s){ return s.find(needle) != string::npos; });
}

int main(int argc, char** argv) {
  const string path = (argc>1 ? argv[1] : "data/default_input.json");

  // 1) Fichier par défaut : tous les modes disponibles
  {
    vector<string> errors, warnings;
    auto p = lb::io::read_params_json(path, &errors, &warnings);
    assert(p.has_value());
    assert(errors.empty());
    assert(p->principal == 600000.0);
    assert(p->credit_rate == 8.0);
    assert(p->inflation_rate == 3.0);
    assert(p->has_budget());
    assert(*p->acceptable_payment == 6000.0);
    assert(*p->investment_rate == 5.0);
  }

  // 2) Clés optionnelles absentes : pas d'erreur, budget absent
  {
    vector<string> errors;
    auto p = lb::io::parse_params_json(
        R"({"Credit amount": 100000, "Credit rate": [6.0], "Expected inflation": [-1.5]})", &errors);
    assert(p && errors.empty());
    assert(!p->has_budget());
    assert(p->inflation_rate == -1.5);
  }

  // 3) Clé obligatoire manquante
  {
    vector<string> errors;
    auto p = lb::io::parse_params_json(R"({"Credit amount": 1, "Credit rate": [6.0]})", &errors);
    assert(!p);
    assert(has(errors, "There's no Expected inflation in the input file"));
  }

  // 4) Tableau vide
  {
    vector<string> errors;
    auto p = lb::io::parse_params_json(
        R"({"Credit amount": 1, "Credit rate": [], "Expected inflation": [2]})", &errors);
    assert(!p);
    assert(has(errors, "Credit rate is empty"));
  }

  // 5) Types invalides
  {
    vector<string> errors;
    assert(!lb::io::parse_params_json(
        R"({"Credit amount": "lots", "Credit rate": [6], "Expected inflation": [2]})", &errors));
    assert(has(errors, "Credit amount must be a number"));
    errors.clear();
    assert(!lb::io::parse_params_json(
        R"({"Credit amount": 1, "Credit rate": 6, "Expected inflation": [2]})", &errors));
    assert(has(errors, "Credit rate must be an array"));
    errors.clear();
    assert(!lb::io::parse_params_json(
        R"({"Credit amount": 1, "Credit rate": ["6"], "Expected inflation": [2]})", &errors));
    assert(has(errors, "first value is not a number"));
  }

  // 6) JSON mal formé / racine non objet
  {
    vector<string> errors;
    assert(!lb::io::parse_params_json(R"({"Credit amount": 1,)", &errors));
    assert(has(errors, "An error occured during input file decoding"));
    errors.clear();
    assert(!lb::io::parse_params_json("[1, 2]", &errors));
    assert(has(errors, "JSON object"));
  }

  // 7) Valeurs hors domaine (std::invalid_argument converti en erreur)
  {
    vector<string> errors;
    assert(!lb::io::parse_params_json(
        R"({"Credit amount": -5, "Credit rate": [6], "Expected inflation": [2]})", &errors));
    assert(has(errors, "principal"));
    errors.clear();
    assert(!lb::io::parse_params_json(
        R"({"Credit amount": 5, "Credit rate": [6], "Expected inflation": [2],
            "Acceptable monthly payment": [100], "Investment interest rate": [-1]})", &errors));
    assert(has(errors, "investment rate"));
  }

  // 8) Plusieurs valeurs : seule la première est utilisée (warning)
  {
    vector<string> errors, warnings;
    auto p = lb::io::parse_params_json(
        R"({"Credit amount": 600000, "Credit rate": [8.0, 7.0], "Expected inflation": [3.0, 4.0, 2.0]})",
        &errors, &warnings);
    assert(p && p->credit_rate == 8.0 && p->inflation_rate == 3.0);
    assert(has(warnings, "Credit rate: only the first value is used"));
    assert(has(warnings, "Expected inflation: only the first value is used"));
  }

  // 9) Budget incomplet : warning, modes budget indisponibles
  {
    vector<string> errors, warnings;
    auto p = lb::io::parse_params_json(
        R"({"Credit amount": 1, "Credit rate": [6], "Expected inflation": [2],
            "Acceptable monthly payment": [500]})", &errors, &warnings);
    assert(p && !p->has_budget());
    assert(has(warnings, "must both be set"));
  }

  // 10) Chemins : traversée refusée, fichier absent
  {
    vector<string> errors;
    assert(!lb::io::read_params_json("../secret/input.json", &errors));
    assert(has(errors, "Path traversal detected"));
    errors.clear();
    assert(!lb::io::read_params_json("no_such_dir/none.json", &errors));
    assert(has(errors, "Cannot open input file"));
  }

  // 11) Fichier d'exemple : écriture puis relecture
  {
    const auto tmp = std::filesystem::temp_directory_path() / "lb_sample_input.json";
    string err;
    assert(lb::io::write_sample_params_json(tmp.string(), &err));
    vector<string> errors;
    auto p = lb::io::read_params_json(tmp.string(), &errors);
    assert(p && p->principal == 600000.0 && *p->acceptable_payment == 6000.0);
    std::filesystem::remove(tmp);
  }

  cout << "params json OK\n";
  return 0;
}
