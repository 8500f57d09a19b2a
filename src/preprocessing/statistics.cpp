#include "preprocessing/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace preprocessing {

namespace {

std::vector<double> finite_sorted(std::vector<double> values) {
  values.erase(std::remove_if(values.begin(), values.end(),
                              [](double v) { return std::isnan(v); }),
               values.end());
  std::sort(values.begin(), values.end());
  return values;
}

double sorted_quantile(const std::vector<double> &sorted, double q) {
  if (sorted.empty())
    return std::numeric_limits<double>::quiet_NaN();
  const double pos = q * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<size_t>(std::floor(pos));
  const size_t hi = std::min(lo + 1, sorted.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

} // namespace

double median(std::vector<double> values) {
  return sorted_quantile(finite_sorted(std::move(values)), 0.5);
}

double quantile(std::vector<double> values, double q) {
  return sorted_quantile(finite_sorted(std::move(values)),
                         std::clamp(q, 0.0, 1.0));
}

double skewness(const std::vector<double> &values) {
  double sum = 0.0;
  size_t n = 0;
  for (double v : values) {
    if (std::isnan(v))
      continue;
    sum += v;
    ++n;
  }
  if (n < 3)
    return 0.0;

  const double mean = sum / static_cast<double>(n);
  double m2 = 0.0;
  double m3 = 0.0;
  for (double v : values) {
    if (std::isnan(v))
      continue;
    const double d = v - mean;
    m2 += d * d;
    m3 += d * d * d;
  }
  m2 /= static_cast<double>(n);
  m3 /= static_cast<double>(n);
  if (m2 <= 0.0)
    return 0.0;

  const double g1 = m3 / std::pow(m2, 1.5);
  const auto dn = static_cast<double>(n);
  return g1 * std::sqrt(dn * (dn - 1.0)) / (dn - 2.0);
}

} // namespace preprocessing
