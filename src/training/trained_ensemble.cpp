#include "training/trained_ensemble.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace training {

ImportanceType importance_type_from_string(const std::string &name) {
  std::string lowered = Utils::to_lower_copy(name);
  if (lowered == "split")
    return ImportanceType::SPLIT;
  if (lowered == "gain")
    return ImportanceType::GAIN;
  throw ConfigError("unknown importance type '" + name + "'");
}

const char *importance_type_to_string(ImportanceType type) {
  return type == ImportanceType::SPLIT ? "split" : "gain";
}

TrainedEnsemble::TrainedEnsemble(std::string model_text,
                                 std::vector<std::string> class_names,
                                 std::vector<std::string> feature_names,
                                 json metadata)
    : model_text_(std::move(model_text)), class_names_(std::move(class_names)),
      feature_names_(std::move(feature_names)), metadata_(std::move(metadata)) {
  BoosterHandle booster = nullptr;
  check_lgbm(LGBM_BoosterLoadModelFromString(model_text_.c_str(), &num_rounds_,
                                             &booster),
             "BoosterLoadModelFromString");
  booster_.reset(booster);

  int num_classes = 0;
  check_lgbm(LGBM_BoosterGetNumClasses(booster_.get(), &num_classes),
             "BoosterGetNumClasses");
  if (static_cast<size_t>(num_classes) != class_names_.size())
    throw PipelineError("model has " + std::to_string(num_classes) +
                        " classes, metadata names " +
                        std::to_string(class_names_.size()));

  int num_features = 0;
  check_lgbm(LGBM_BoosterGetNumFeature(booster_.get(), &num_features),
             "BoosterGetNumFeature");
  if (static_cast<size_t>(num_features) != feature_names_.size())
    throw PipelineError("model expects " + std::to_string(num_features) +
                        " features, metadata names " +
                        std::to_string(feature_names_.size()));
}

TrainedEnsemble TrainedEnsemble::load(const std::string &model_path,
                                      const std::string &metadata_path) {
  std::ifstream model_in(model_path);
  if (!model_in.is_open())
    throw PipelineError("Could not open model file: " + model_path);
  std::stringstream model_text;
  model_text << model_in.rdbuf();

  std::ifstream meta_in(metadata_path);
  if (!meta_in.is_open())
    throw PipelineError("Could not open model metadata: " + metadata_path);

  json metadata;
  try {
    metadata = json::parse(meta_in);
  } catch (const json::parse_error &e) {
    throw PipelineError("Malformed model metadata " + metadata_path + ": " +
                        e.what());
  }

  auto classes = metadata.at("class_names").get<std::vector<std::string>>();
  auto features = metadata.at("feature_names").get<std::vector<std::string>>();
  LOG(LogLevel::INFO, LogComponent::OUTPUT,
      "Loaded model from " << model_path << " (" << classes.size()
                           << " classes, " << features.size() << " features)");
  return TrainedEnsemble(model_text.str(), std::move(classes),
                         std::move(features), std::move(metadata));
}

std::vector<double>
TrainedEnsemble::predict_proba(const dataset::FeatureMatrix &matrix) const {
  if (matrix.cols() != feature_names_.size())
    throw PipelineError("matrix has " + std::to_string(matrix.cols()) +
                        " features, model expects " +
                        std::to_string(feature_names_.size()));

  std::vector<double> out(matrix.rows * num_classes());
  if (matrix.rows == 0)
    return out;

  int64_t out_len = 0;
  check_lgbm(LGBM_BoosterPredictForMat(
                 booster_.get(), matrix.values.data(), C_API_DTYPE_FLOAT64,
                 static_cast<int32_t>(matrix.rows),
                 static_cast<int32_t>(matrix.cols()), 1, C_API_PREDICT_NORMAL,
                 0, -1, "", &out_len, out.data()),
             "BoosterPredictForMat");
  if (static_cast<size_t>(out_len) != out.size())
    throw PipelineError("unexpected prediction size " +
                        std::to_string(out_len));
  return out;
}

std::vector<int>
TrainedEnsemble::predict(const dataset::FeatureMatrix &matrix) const {
  std::vector<double> proba = predict_proba(matrix);
  const size_t k = num_classes();
  std::vector<int> ids;
  ids.reserve(matrix.rows);
  for (size_t r = 0; r < matrix.rows; ++r) {
    auto begin = proba.begin() + static_cast<std::ptrdiff_t>(r * k);
    auto best = std::max_element(begin, begin + static_cast<std::ptrdiff_t>(k));
    ids.push_back(static_cast<int>(best - begin));
  }
  return ids;
}

std::vector<double> TrainedEnsemble::feature_importance(ImportanceType type) const {
  std::vector<double> scores(feature_names_.size());
  check_lgbm(LGBM_BoosterFeatureImportance(
                 booster_.get(), 0,
                 type == ImportanceType::SPLIT ? C_API_FEATURE_IMPORTANCE_SPLIT
                                               : C_API_FEATURE_IMPORTANCE_GAIN,
                 scores.data()),
             "BoosterFeatureImportance");
  return scores;
}

json TrainedEnsemble::metadata_json() const {
  json meta = metadata_;
  meta["class_names"] = class_names_;
  meta["feature_names"] = feature_names_;
  meta["num_rounds"] = num_rounds_;
  return meta;
}

void TrainedEnsemble::save(const std::string &model_path,
                           const std::string &metadata_path) const {
  Utils::create_directory_for_file(model_path);
  std::ofstream model_out(model_path);
  if (!model_out.is_open())
    throw PipelineError("Could not write model file: " + model_path);
  model_out << model_text_;

  Utils::create_directory_for_file(metadata_path);
  std::ofstream meta_out(metadata_path);
  if (!meta_out.is_open())
    throw PipelineError("Could not write model metadata: " + metadata_path);
  meta_out << metadata_json().dump(2) << "\n";

  LOG(LogLevel::INFO, LogComponent::OUTPUT,
      "Model written to " << model_path << ", metadata to " << metadata_path);
}

} // namespace training
