#ifndef FEATURE_MATRIX_HPP
#define FEATURE_MATRIX_HPP

#include "dataset/dataset_loader.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace dataset {

// Dense row-major matrix of numeric features. Missing values are NaN until
// imputation replaces them.
struct FeatureMatrix {
  std::vector<std::string> feature_names;
  std::vector<double> values;
  size_t rows = 0;

  size_t cols() const { return feature_names.size(); }

  double at(size_t row, size_t col) const { return values[row * cols() + col]; }
  double &at(size_t row, size_t col) { return values[row * cols() + col]; }

  std::vector<double> column(size_t col) const;
  FeatureMatrix select_rows(const std::vector<size_t> &indices) const;
};

struct LabeledMatrix {
  FeatureMatrix features;
  std::vector<std::string> labels;
  std::vector<RowOrigin> origins;

  size_t rows() const { return features.rows; }
  LabeledMatrix select_rows(const std::vector<size_t> &indices) const;
};

} // namespace dataset

#endif // FEATURE_MATRIX_HPP
