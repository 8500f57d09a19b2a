#include "dataset/feature_matrix.hpp"

namespace dataset {

std::vector<double> FeatureMatrix::column(size_t col) const {
  std::vector<double> out;
  out.reserve(rows);
  for (size_t r = 0; r < rows; ++r)
    out.push_back(at(r, col));
  return out;
}

FeatureMatrix FeatureMatrix::select_rows(const std::vector<size_t> &indices) const {
  FeatureMatrix out;
  out.feature_names = feature_names;
  out.rows = indices.size();
  out.values.reserve(indices.size() * cols());
  for (size_t idx : indices) {
    auto begin = values.begin() + static_cast<std::ptrdiff_t>(idx * cols());
    out.values.insert(out.values.end(), begin,
                      begin + static_cast<std::ptrdiff_t>(cols()));
  }
  return out;
}

LabeledMatrix LabeledMatrix::select_rows(const std::vector<size_t> &indices) const {
  LabeledMatrix out;
  out.features = features.select_rows(indices);
  out.labels.reserve(indices.size());
  out.origins.reserve(indices.size());
  for (size_t idx : indices) {
    out.labels.push_back(labels[idx]);
    out.origins.push_back(origins[idx]);
  }
  return out;
}

} // namespace dataset
