#include "training/lightgbm_backend.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <limits>
#include <sstream>

namespace training {

namespace {
constexpr const char *TRAINING_METRICS[] = {"multi_logloss", "multi_error"};
}

std::string build_lightgbm_parameters(const Config::TrainingConfig &config,
                                      size_t num_classes) {
  std::ostringstream params;
  params.precision(std::numeric_limits<double>::max_digits10);
  params << "objective=multiclass"
         << " num_class=" << num_classes << " metric=";
  bool first = true;
  for (const char *metric : TRAINING_METRICS) {
    params << (first ? "" : ",") << metric;
    first = false;
  }
  params << " is_provide_training_metric=true"
         << " deterministic=true"
         << " force_row_wise=true"
         << " verbosity=-1"
         << " seed=" << config.seed << " num_threads=" << config.num_threads
         << " learning_rate=" << config.learning_rate
         << " num_leaves=" << config.num_leaves
         << " feature_fraction=" << config.feature_fraction
         << " bagging_fraction=" << config.bagging_fraction
         << " bagging_freq=" << config.bagging_freq
         << " min_data_in_leaf=" << config.min_data_in_leaf
         << " lambda_l2=" << config.lambda_l2;
  return params.str();
}

LightGbmBackend::LightGbmBackend(const Config::TrainingConfig &config,
                                 const dataset::LabeledMatrix &train,
                                 const dataset::LabeledMatrix &validation,
                                 const LabelEncoder &encoder)
    : parameters_(build_lightgbm_parameters(config, encoder.size())) {
  for (const char *metric : TRAINING_METRICS)
    metric_names_.emplace_back(metric);

  if (train.features.cols() != validation.features.cols())
    throw PipelineError("train and validation matrices differ in width");

  LOG(LogLevel::DEBUG, LogComponent::TRAIN,
      "LightGBM parameters: " << parameters_);

  train_data_ = make_dataset(train, encoder, nullptr);
  validation_data_ = make_dataset(validation, encoder, train_data_.get());

  BoosterHandle booster = nullptr;
  check_lgbm(LGBM_BoosterCreate(train_data_.get(), parameters_.c_str(),
                                &booster),
             "BoosterCreate");
  booster_.reset(booster);
  check_lgbm(LGBM_BoosterAddValidData(booster_.get(), validation_data_.get()),
             "BoosterAddValidData");

  int eval_count = 0;
  check_lgbm(LGBM_BoosterGetEvalCounts(booster_.get(), &eval_count),
             "BoosterGetEvalCounts");
  if (static_cast<size_t>(eval_count) != metric_names_.size())
    throw PipelineError("LightGBM reports " + std::to_string(eval_count) +
                        " metrics, expected " +
                        std::to_string(metric_names_.size()));
}

DatasetPtr LightGbmBackend::make_dataset(const dataset::LabeledMatrix &data,
                                         const LabelEncoder &encoder,
                                         DatasetHandle reference) const {
  const auto nrow = static_cast<int32_t>(data.rows());
  const auto ncol = static_cast<int32_t>(data.features.cols());

  DatasetHandle handle = nullptr;
  check_lgbm(LGBM_DatasetCreateFromMat(data.features.values.data(),
                                       C_API_DTYPE_FLOAT64, nrow, ncol, 1,
                                       parameters_.c_str(), reference, &handle),
             "DatasetCreateFromMat");
  DatasetPtr dataset(handle);

  std::vector<float> labels;
  labels.reserve(data.labels.size());
  for (const auto &label : data.labels)
    labels.push_back(static_cast<float>(encoder.encode(label)));
  check_lgbm(LGBM_DatasetSetField(dataset.get(), "label", labels.data(),
                                  static_cast<int>(labels.size()),
                                  C_API_DTYPE_FLOAT32),
             "DatasetSetField(label)");
  return dataset;
}

bool LightGbmBackend::update_one_round() {
  int is_finished = 0;
  check_lgbm(LGBM_BoosterUpdateOneIter(booster_.get(), &is_finished),
             "BoosterUpdateOneIter");
  return is_finished != 0;
}

std::map<std::string, double> LightGbmBackend::read_eval(int data_idx) const {
  std::vector<double> values(metric_names_.size());
  int out_len = 0;
  check_lgbm(LGBM_BoosterGetEval(booster_.get(), data_idx, &out_len,
                                 values.data()),
             "BoosterGetEval");

  std::map<std::string, double> metrics;
  for (size_t i = 0; i < metric_names_.size() &&
                     i < static_cast<size_t>(out_len);
       ++i)
    metrics[metric_names_[i]] = values[i];
  return metrics;
}

RoundEvaluation LightGbmBackend::evaluate() const {
  RoundEvaluation eval;
  eval.train = read_eval(0);
  eval.validation = read_eval(1);
  return eval;
}

std::string LightGbmBackend::export_model(int num_rounds) const {
  int64_t out_len = 0;
  check_lgbm(LGBM_BoosterSaveModelToString(booster_.get(), 0, num_rounds,
                                           C_API_FEATURE_IMPORTANCE_SPLIT, 0,
                                           &out_len, nullptr),
             "BoosterSaveModelToString");

  std::vector<char> buffer(static_cast<size_t>(out_len));
  int64_t written = 0;
  check_lgbm(LGBM_BoosterSaveModelToString(booster_.get(), 0, num_rounds,
                                           C_API_FEATURE_IMPORTANCE_SPLIT,
                                           out_len, &written, buffer.data()),
             "BoosterSaveModelToString");

  // out_len counts the terminating NUL
  return std::string(buffer.data());
}

} // namespace training
