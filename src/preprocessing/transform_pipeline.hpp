#ifndef TRANSFORM_PIPELINE_HPP
#define TRANSFORM_PIPELINE_HPP

#include "core/config.hpp"
#include "preprocessing/column_filter.hpp"
#include "preprocessing/transform_stage.hpp"

#include <memory>
#include <string>
#include <vector>

namespace preprocessing {

// Column filter -> median imputation -> skew correction -> robust scaling.
// The filter runs on whole tables before splitting; the three stateful
// stages are fitted on the training split and applied to every split.
class TransformPipeline {
public:
  TransformPipeline(dataset::FeatureSchema schema,
                    const Config::PreprocessingConfig &config);

  dataset::LabeledMatrix select_features(const dataset::MergedDataset &data) const;

  // Fits every stage in order; each stage sees the output of the previous
  // one on the training rows.
  void fit(const dataset::FeatureMatrix &train);

  dataset::FeatureMatrix apply(const dataset::FeatureMatrix &matrix) const;
  void apply_in_place(dataset::FeatureMatrix &matrix) const;

  bool is_fitted() const { return fitted_; }

  // Fitted parameters of every stage. Identical for identical training rows.
  nlohmann::json state_json() const;
  void save_state(const std::string &path) const;

  const ColumnFilter &column_filter() const { return filter_; }
  const MedianImputer &imputer() const { return *imputer_; }
  const SkewCorrector &skew_corrector() const { return *skew_; }
  const RobustScaler &scaler() const { return *scaler_; }

private:
  ColumnFilter filter_;
  // Owned by stages_, kept typed for inspection
  MedianImputer *imputer_;
  SkewCorrector *skew_;
  RobustScaler *scaler_;
  std::vector<std::unique_ptr<ITransformStage>> stages_;
  bool fitted_ = false;
};

} // namespace preprocessing

#endif // TRANSFORM_PIPELINE_HPP
