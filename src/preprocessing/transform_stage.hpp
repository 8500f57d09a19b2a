#ifndef TRANSFORM_STAGE_HPP
#define TRANSFORM_STAGE_HPP

#include "dataset/feature_matrix.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace preprocessing {

// One stateful step of the feature transform. `fit` learns parameters from
// the training split only; `apply` transforms any split with them and never
// touches the fitted state.
class ITransformStage {
public:
  virtual ~ITransformStage() = default;
  virtual const char *get_name() const = 0;
  virtual void fit(const dataset::FeatureMatrix &train) = 0;
  virtual void apply(dataset::FeatureMatrix &matrix) const = 0;
  virtual nlohmann::json to_json() const = 0;

  bool is_fitted() const { return !feature_names_.empty(); }

protected:
  // Throws PipelineError when called before fit or on a matrix whose
  // columns differ from the ones the stage was fitted on.
  void check_compatible(const dataset::FeatureMatrix &matrix) const;

  std::vector<std::string> feature_names_;
};

class MedianImputer : public ITransformStage {
public:
  const char *get_name() const override { return "median_imputation"; }
  // Throws EmptyColumnError naming the first entirely missing feature
  void fit(const dataset::FeatureMatrix &train) override;
  void apply(dataset::FeatureMatrix &matrix) const override;
  nlohmann::json to_json() const override;

  const std::vector<double> &medians() const { return medians_; }

private:
  std::vector<double> medians_;
};

// log(1 + max(x, 0)) on features whose training skewness exceeds the
// threshold. Negative values are clamped, which loses their magnitude.
class SkewCorrector : public ITransformStage {
public:
  explicit SkewCorrector(double threshold) : threshold_(threshold) {}

  const char *get_name() const override { return "skew_correction"; }
  void fit(const dataset::FeatureMatrix &train) override;
  void apply(dataset::FeatureMatrix &matrix) const override;
  nlohmann::json to_json() const override;

  const std::vector<double> &skewness() const { return skewness_; }
  const std::vector<bool> &marked() const { return marked_; }

private:
  double threshold_;
  std::vector<double> skewness_;
  std::vector<bool> marked_;
};

class RobustScaler : public ITransformStage {
public:
  // Quantiles are given in percent, e.g. 25 and 75 for the IQR
  RobustScaler(bool with_centering, double quantile_low, double quantile_high)
      : with_centering_(with_centering), quantile_low_(quantile_low),
        quantile_high_(quantile_high) {}

  const char *get_name() const override { return "robust_scaling"; }
  void fit(const dataset::FeatureMatrix &train) override;
  // A zero scale maps every value of that feature to 0
  void apply(dataset::FeatureMatrix &matrix) const override;
  nlohmann::json to_json() const override;

  const std::vector<double> &centers() const { return centers_; }
  const std::vector<double> &scales() const { return scales_; }

private:
  bool with_centering_;
  double quantile_low_;
  double quantile_high_;
  std::vector<double> centers_;
  std::vector<double> scales_;
};

} // namespace preprocessing

#endif // TRANSFORM_STAGE_HPP
