#include <lb/config/loan_params.hpp>
#include <lb/sweep/term_sweep.hpp>
#include <lb/io/params_json.hpp>
#include <lb/io/report.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " [params.json] [--mode plain|overpayment|invest-surplus|all]"
            << " [--csv PREFIX] [--write-sample]\n"
            << "  default params file: " << lb::io::kDefaultInputPath << "\n";
}

int main(int argc, char** argv) {
  std::string path = lb::io::kDefaultInputPath;
  std::string csv_prefix;
  bool all_modes = true;
  bool write_sample = false;
  lb::sweep::SweepMode only = lb::sweep::SweepMode::Plain;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--mode" && i + 1 < argc) {
      std::string m = argv[++i];
      if (m == "all") {
        all_modes = true;
      } else if (lb::sweep::parse_mode(m.c_str(), only)) {
        all_modes = false;
      } else {
        std::cerr << "Unknown --mode: " << m << "\n";
        return 1;
      }
    } else if (arg == "--csv" && i + 1 < argc) {
      csv_prefix = argv[++i];
    } else if (arg.rfind("--csv=", 0) == 0) {
      csv_prefix = arg.substr(6);
    } else if (arg == "--write-sample") {
      write_sample = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] != '-') {
      path = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  std::cout << "Credit parameters input file path: " << path << "\n";

  if (write_sample) {
    std::string err;
    if (!lb::io::write_sample_params_json(path, &err)) {
      std::cerr << "Error: " << err << "\n";
      return 2;
    }
    std::cerr << "[info] sample parameters written to " << path << "\n";
  }

  std::vector<std::string> errors, warnings;
  const auto params = lb::io::read_params_json(path, &errors, &warnings);
  for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  if (!params) {
    for (const auto& e : errors) std::cerr << "ERROR: " << e << "\n";
    std::cerr << "Provided data has incorrect format, can't proceed\n";
    return 2;
  }

  lb::io::print_parameters(std::cout, *params);

  std::vector<lb::sweep::SweepMode> modes;
  if (all_modes) {
    modes = {lb::sweep::SweepMode::Plain,
             lb::sweep::SweepMode::Overpayment,
             lb::sweep::SweepMode::InvestSurplus};
  } else {
    modes = {only};
  }

  try {
    for (const auto mode : modes) {
      if (!lb::sweep::mode_available(*params, mode)) {
        std::cerr << "[warn] mode '" << lb::sweep::to_string(mode)
                  << "' needs \"" << lb::io::kKeyAcceptablePayment << "\" and \""
                  << lb::io::kKeyInvestmentRate << "\", skipped\n";
        continue;
      }

      const auto results = lb::sweep::run_sweep(*params, mode);
      std::cout << "\nCredit calculations (" << lb::sweep::to_string(mode) << "):\n";
      lb::io::print_results(std::cout, results, mode);

      // Plain : solde d'un placement du surplus, à titre indicatif
      if (mode == lb::sweep::SweepMode::Plain && params->has_budget()) {
        const auto balances = lb::sweep::surplus_balances(*params, results);
        if (!balances.empty()) {
          std::cout << "Investing the surplus of the acceptable payment:\n";
          lb::io::print_surplus_balances(std::cout, balances);
        }
      }

      if (!csv_prefix.empty()) {
        const std::string file = csv_prefix + "_" + lb::sweep::to_string(mode) + ".csv";
        std::string err;
        if (!lb::io::save_results_csv(file, results, &err)) {
          std::cerr << err << "\n";
          return 2;
        }
        std::cout << "results written to: " << file << "\n";
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }

  return 0;
}
