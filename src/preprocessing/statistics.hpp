#ifndef PREPROCESSING_STATISTICS_HPP
#define PREPROCESSING_STATISTICS_HPP

#include <vector>

namespace preprocessing {

// The helpers below ignore NaN entries. On an empty input they return NaN.

double median(std::vector<double> values);

// Quantile q in [0, 1] with linear interpolation between closest ranks
// (position (n - 1) * q).
double quantile(std::vector<double> values, double q);

// Adjusted Fisher-Pearson coefficient G1. Returns 0 for fewer than three
// values or a constant column.
double skewness(const std::vector<double> &values);

} // namespace preprocessing

#endif // PREPROCESSING_STATISTICS_HPP
