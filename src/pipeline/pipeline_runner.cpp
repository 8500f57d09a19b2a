#include "pipeline/pipeline_runner.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "dataset/data_splitter.hpp"
#include "dataset/dataset_loader.hpp"
#include "dataset/feature_schema.hpp"
#include "preprocessing/transform_pipeline.hpp"
#include "training/label_encoder.hpp"
#include "training/lightgbm_backend.hpp"
#include "training/trained_ensemble.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <utility>

using json = nlohmann::json;

namespace {

Histogram &stage_timer(const std::string &stage) {
  return *MetricsManager::instance().register_histogram(
      "ics_stage_duration_seconds_" + stage,
      "Wall time of the " + stage + " pipeline stage.");
}

} // namespace

PipelineRunner::PipelineRunner(const Config::AppConfig &config,
                               const std::atomic<bool> *cancel_flag)
    : config_(config), cancel_flag_(cancel_flag),
      backend_factory_([](const Config::TrainingConfig &training_config,
                          const dataset::LabeledMatrix &train,
                          const dataset::LabeledMatrix &validation,
                          const training::LabelEncoder &encoder) {
        return std::unique_ptr<training::IBoosterBackend>(
            new training::LightGbmBackend(training_config, train, validation,
                                          encoder));
      }) {}

void PipelineRunner::set_backend_factory(BackendFactory factory) {
  backend_factory_ = std::move(factory);
}

bool PipelineRunner::cancellation_requested() const {
  return cancel_flag_ != nullptr && cancel_flag_->load();
}

RunArtifacts PipelineRunner::artifact_paths() const {
  const std::filesystem::path dir = config_.output.output_dir;
  RunArtifacts paths;
  paths.model = dir / config_.output.model_file;
  paths.metadata = dir / config_.output.metadata_file;
  paths.report = dir / config_.output.report_file;
  paths.importance = dir / config_.output.importance_file;
  paths.transform_state = dir / config_.output.transform_state_file;
  paths.metrics = dir / config_.output.metrics_file;
  return paths;
}

void PipelineRunner::write_run_metrics(const std::filesystem::path &path) const {
  Utils::create_directory_for_file(path.string());
  std::ofstream out(path);
  if (!out.is_open())
    throw PipelineError("Could not write run metrics to " + path.string());
  out << MetricsManager::instance().expose_as_json() << "\n";
}

RunSummary PipelineRunner::run() {
  RunSummary summary;
  summary.artifacts = artifact_paths();
  const int window = config_.dataset.time_window;

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Pipeline starting for time window " << window << "s");

  if (config_.dataset.unpack) {
    ScopedTimer timer(stage_timer("unpack"), "unpack");
    unpack::DatasetUnpacker unpacker(
        unpack::UnpackOptions::from_config(config_.dataset), cancel_flag_);
    summary.unpack_report = unpacker.run();
    if (summary.unpack_report->cancelled) {
      summary.cancelled = true;
      return summary;
    }
  } else {
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Unpacking disabled, reading extracted tables from "
            << config_.resolved_data_dir());
  }

  if (cancellation_requested()) {
    summary.cancelled = true;
    return summary;
  }

  dataset::MergedDataset merged;
  {
    ScopedTimer timer(stage_timer("load"), "load");
    dataset::DatasetLoader loader(config_.resolved_data_dir(),
                                  config_.dataset.benign_class,
                                  config_.dataset.label_column);
    merged = loader.load(window);
  }
  summary.merged_rows = merged.row_count();

  dataset::FeatureSchema schema = dataset::FeatureSchema::resolve(
      config_.schema, config_.dataset.label_column, merged);
  schema.validate(merged);

  preprocessing::TransformPipeline transforms(schema, config_.preprocessing);
  dataset::DatasetSplits splits;
  {
    ScopedTimer timer(stage_timer("preprocess"), "preprocess");
    dataset::LabeledMatrix labeled = transforms.select_features(merged);
    splits = dataset::DataSplitter(config_.split).split(labeled);

    transforms.fit(splits.train.features);
    transforms.apply_in_place(splits.train.features);
    transforms.apply_in_place(splits.validation.features);
    transforms.apply_in_place(splits.test.features);
  }
  summary.train_rows = splits.train.rows();
  summary.validation_rows = splits.validation.rows();
  summary.test_rows = splits.test.rows();
  transforms.save_state(summary.artifacts.transform_state.string());

  if (cancellation_requested()) {
    summary.cancelled = true;
    return summary;
  }

  training::LabelEncoder encoder(merged.class_labels());
  training::TrainingResult result;
  {
    ScopedTimer timer(stage_timer("train"), "train");
    std::unique_ptr<training::IBoosterBackend> backend = backend_factory_(
        config_.training, splits.train, splits.validation, encoder);
    training::GbdtTrainer trainer(config_.training, cancel_flag_);
    try {
      result = trainer.run(*backend);
    } catch (const TrainingDivergedError &e) {
      if (!e.best_model().empty()) {
        std::filesystem::path fallback = summary.artifacts.model;
        fallback += ".diverged";
        Utils::create_directory_for_file(fallback.string());
        std::ofstream out(fallback);
        if (out.is_open()) {
          out << e.best_model();
          LOG(LogLevel::ERROR, LogComponent::TRAIN,
              "Best model before divergence (round "
                  << e.best_round() << ") saved to " << fallback.string());
        } else {
          LOG(LogLevel::ERROR, LogComponent::TRAIN,
              "Could not save the pre-divergence model to "
                  << fallback.string());
        }
      }
      throw;
    }
  }
  summary.best_round = result.best_round;
  summary.rounds_completed = result.rounds_completed;
  if (cancellation_requested()) {
    summary.cancelled = true;
    return summary;
  }

  json metadata = {
      {"time_window", window},
      {"objective", "multiclass"},
      {"monitor_metric", result.monitor_metric},
      {"best_round", result.best_round},
      {"best_score", result.best_score},
      {"rounds_completed", result.rounds_completed},
      {"stopped_early", result.stopped_early},
      {"hyperparameters",
       {{"learning_rate", config_.training.learning_rate},
        {"num_leaves", config_.training.num_leaves},
        {"feature_fraction", config_.training.feature_fraction},
        {"bagging_fraction", config_.training.bagging_fraction},
        {"bagging_freq", config_.training.bagging_freq},
        {"max_rounds", config_.training.max_rounds},
        {"early_stopping_rounds", config_.training.early_stopping_rounds},
        {"min_delta", config_.training.min_delta},
        {"min_data_in_leaf", config_.training.min_data_in_leaf},
        {"lambda_l2", config_.training.lambda_l2},
        {"seed", config_.training.seed}}},
      {"split",
       {{"train_rows", summary.train_rows},
        {"validation_rows", summary.validation_rows},
        {"test_rows", summary.test_rows},
        {"seed", config_.split.seed}}},
      {"history", result.history_json()}};

  training::TrainedEnsemble ensemble(result.model_text, encoder.classes(),
                                     splits.train.features.feature_names,
                                     std::move(metadata));
  ensemble.save(summary.artifacts.model.string(),
                summary.artifacts.metadata.string());

  {
    ScopedTimer timer(stage_timer("evaluate"), "evaluate");
    evaluation::Evaluator evaluator(
        training::importance_type_from_string(config_.output.importance_type));
    evaluation::EvaluationReport report =
        evaluator.evaluate(ensemble, splits.test, window);
    report.write_json(summary.artifacts.report.string());
    report.write_importance_csv(summary.artifacts.importance.string());
    summary.test_accuracy = report.classification.accuracy;
    summary.test_macro_f1 = report.classification.macro_f1;
  }

  write_run_metrics(summary.artifacts.metrics);
  LOG(LogLevel::INFO, LogComponent::OUTPUT,
      "Artifacts written to " << config_.output.output_dir);
  return summary;
}
