#include "preprocessing/transform_pipeline.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <utility>

using json = nlohmann::json;

namespace preprocessing {

TransformPipeline::TransformPipeline(dataset::FeatureSchema schema,
                                     const Config::PreprocessingConfig &config)
    : filter_(std::move(schema)) {
  auto imputer = std::make_unique<MedianImputer>();
  auto skew = std::make_unique<SkewCorrector>(config.skew_threshold);
  auto scaler = std::make_unique<RobustScaler>(
      config.robust_centering, config.quantile_low, config.quantile_high);
  imputer_ = imputer.get();
  skew_ = skew.get();
  scaler_ = scaler.get();
  stages_.push_back(std::move(imputer));
  stages_.push_back(std::move(skew));
  stages_.push_back(std::move(scaler));
}

dataset::LabeledMatrix
TransformPipeline::select_features(const dataset::MergedDataset &data) const {
  return filter_.apply(data);
}

void TransformPipeline::fit(const dataset::FeatureMatrix &train) {
  static Histogram *fit_timer = MetricsManager::instance().register_histogram(
      "ics_transform_fit_duration_seconds",
      "Time spent fitting the feature transform pipeline.");
  ScopedTimer timer(*fit_timer);

  if (train.rows == 0)
    throw PipelineError("cannot fit the transform pipeline on an empty split");

  fitted_ = false;
  dataset::FeatureMatrix working = train;
  for (auto &stage : stages_) {
    stage->fit(working);
    stage->apply(working);
    LOG(LogLevel::DEBUG, LogComponent::PREPROCESS,
        "Stage " << stage->get_name() << " fitted");
  }
  fitted_ = true;

  LOG(LogLevel::INFO, LogComponent::PREPROCESS,
      "Transform pipeline fitted on " << train.rows << " training rows, "
                                      << train.cols() << " features");
}

void TransformPipeline::apply_in_place(dataset::FeatureMatrix &matrix) const {
  if (!fitted_)
    throw PipelineError("transform pipeline applied before fit");
  for (const auto &stage : stages_)
    stage->apply(matrix);
}

dataset::FeatureMatrix
TransformPipeline::apply(const dataset::FeatureMatrix &matrix) const {
  dataset::FeatureMatrix out = matrix;
  apply_in_place(out);
  return out;
}

json TransformPipeline::state_json() const {
  json stages = json::array();
  stages.push_back(filter_.to_json());
  for (const auto &stage : stages_)
    stages.push_back(stage->to_json());
  return {{"fitted", fitted_}, {"stages", stages}};
}

void TransformPipeline::save_state(const std::string &path) const {
  Utils::create_directory_for_file(path);
  std::ofstream out(path);
  if (!out.is_open())
    throw PipelineError("Could not write transform state to " + path);
  out << state_json().dump(2) << "\n";
}

} // namespace preprocessing
