#include <lb/adjust/inflation.hpp>

#include <cmath>   // std::pow

namespace lb {
namespace adjust {

double inflation_factor(double annual_inflation_percent, double years) noexcept {
  return std::pow(1.0 + annual_inflation_percent / 100.0, years);
}

double adjust_for_inflation(double nominal_cost,
                            double annual_inflation_percent,
                            double years) noexcept {
  return nominal_cost / inflation_factor(annual_inflation_percent, years);
}

} // namespace adjust
} // namespace lb
