#include "preprocessing/transform_stage.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "preprocessing/statistics.hpp"

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace preprocessing {

void ITransformStage::check_compatible(
    const dataset::FeatureMatrix &matrix) const {
  if (!is_fitted())
    throw PipelineError(std::string(get_name()) + ": apply called before fit");
  if (matrix.feature_names != feature_names_)
    throw PipelineError(std::string(get_name()) +
                        ": matrix columns differ from the fitted columns");
}

void MedianImputer::fit(const dataset::FeatureMatrix &train) {
  std::vector<double> medians;
  medians.reserve(train.cols());
  for (size_t c = 0; c < train.cols(); ++c) {
    double m = median(train.column(c));
    if (std::isnan(m))
      throw EmptyColumnError(train.feature_names[c]);
    medians.push_back(m);
  }
  medians_ = std::move(medians);
  feature_names_ = train.feature_names;

  LOG(LogLevel::DEBUG, LogComponent::PREPROCESS,
      "Fitted medians for " << medians_.size() << " features on "
                            << train.rows << " rows");
}

void MedianImputer::apply(dataset::FeatureMatrix &matrix) const {
  check_compatible(matrix);
  for (size_t r = 0; r < matrix.rows; ++r)
    for (size_t c = 0; c < matrix.cols(); ++c)
      if (std::isnan(matrix.at(r, c)))
        matrix.at(r, c) = medians_[c];
}

json MedianImputer::to_json() const {
  json features = json::array();
  for (size_t c = 0; c < feature_names_.size(); ++c)
    features.push_back({{"feature", feature_names_[c]}, {"median", medians_[c]}});
  return {{"stage", get_name()}, {"features", features}};
}

void SkewCorrector::fit(const dataset::FeatureMatrix &train) {
  std::vector<double> skew;
  std::vector<bool> marked;
  size_t marked_count = 0;
  for (size_t c = 0; c < train.cols(); ++c) {
    double s = preprocessing::skewness(train.column(c));
    skew.push_back(s);
    marked.push_back(s > threshold_);
    if (s > threshold_) {
      ++marked_count;
      LOG(LogLevel::DEBUG, LogComponent::PREPROCESS,
          "Feature '" << train.feature_names[c] << "' skewness " << s
                      << " > " << threshold_ << ", log-transformed");
    }
  }
  skewness_ = std::move(skew);
  marked_ = std::move(marked);
  feature_names_ = train.feature_names;

  LOG(LogLevel::INFO, LogComponent::PREPROCESS,
      marked_count << "/" << feature_names_.size()
                   << " features marked for log1p skew correction");
}

void SkewCorrector::apply(dataset::FeatureMatrix &matrix) const {
  check_compatible(matrix);
  for (size_t r = 0; r < matrix.rows; ++r)
    for (size_t c = 0; c < matrix.cols(); ++c)
      if (marked_[c])
        matrix.at(r, c) = std::log1p(std::max(matrix.at(r, c), 0.0));
}

json SkewCorrector::to_json() const {
  json features = json::array();
  for (size_t c = 0; c < feature_names_.size(); ++c)
    features.push_back({{"feature", feature_names_[c]},
                        {"skewness", skewness_[c]},
                        {"log_transformed", static_cast<bool>(marked_[c])}});
  return {{"stage", get_name()},
          {"threshold", threshold_},
          {"features", features}};
}

void RobustScaler::fit(const dataset::FeatureMatrix &train) {
  std::vector<double> centers;
  std::vector<double> scales;
  for (size_t c = 0; c < train.cols(); ++c) {
    std::vector<double> column = train.column(c);
    centers.push_back(with_centering_ ? median(column) : 0.0);
    double low = quantile(column, quantile_low_ / 100.0);
    double high = quantile(column, quantile_high_ / 100.0);
    scales.push_back(high - low);
  }
  centers_ = std::move(centers);
  scales_ = std::move(scales);
  feature_names_ = train.feature_names;

  size_t zero_scale = static_cast<size_t>(
      std::count(scales_.begin(), scales_.end(), 0.0));
  if (zero_scale > 0)
    LOG(LogLevel::WARN, LogComponent::PREPROCESS,
        zero_scale << " features have zero interquantile range and scale to 0");
}

void RobustScaler::apply(dataset::FeatureMatrix &matrix) const {
  check_compatible(matrix);
  for (size_t r = 0; r < matrix.rows; ++r) {
    for (size_t c = 0; c < matrix.cols(); ++c) {
      double &x = matrix.at(r, c);
      x = scales_[c] == 0.0 ? 0.0 : (x - centers_[c]) / scales_[c];
    }
  }
}

json RobustScaler::to_json() const {
  json features = json::array();
  for (size_t c = 0; c < feature_names_.size(); ++c)
    features.push_back({{"feature", feature_names_[c]},
                        {"center", centers_[c]},
                        {"scale", scales_[c]}});
  return {{"stage", get_name()},
          {"with_centering", with_centering_},
          {"quantile_range", {quantile_low_, quantile_high_}},
          {"features", features}};
}

} // namespace preprocessing
