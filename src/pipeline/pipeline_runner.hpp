#ifndef PIPELINE_RUNNER_HPP
#define PIPELINE_RUNNER_HPP

#include "core/config.hpp"
#include "dataset/feature_matrix.hpp"
#include "evaluation/evaluator.hpp"
#include "io/archive/dataset_unpacker.hpp"
#include "training/booster_backend.hpp"
#include "training/gbdt_trainer.hpp"
#include "training/label_encoder.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Paths of every artifact a completed run leaves in the output directory
struct RunArtifacts {
  std::filesystem::path model;
  std::filesystem::path metadata;
  std::filesystem::path report;
  std::filesystem::path importance;
  std::filesystem::path transform_state;
  std::filesystem::path metrics;
};

struct RunSummary {
  bool cancelled = false;
  std::optional<unpack::UnpackReport> unpack_report;
  size_t merged_rows = 0;
  size_t train_rows = 0;
  size_t validation_rows = 0;
  size_t test_rows = 0;
  int best_round = 0;
  int rounds_completed = 0;
  double test_accuracy = 0.0;
  double test_macro_f1 = 0.0;
  RunArtifacts artifacts;
};

// Unpack -> load -> filter -> split -> fit/apply transforms -> train ->
// evaluate -> write artifacts. Every stage failure propagates as the
// matching PipelineError subclass.
class PipelineRunner {
public:
  explicit PipelineRunner(const Config::AppConfig &config,
                          const std::atomic<bool> *cancel_flag = nullptr);

  using BackendFactory = std::function<std::unique_ptr<training::IBoosterBackend>(
      const Config::TrainingConfig &, const dataset::LabeledMatrix &train,
      const dataset::LabeledMatrix &validation,
      const training::LabelEncoder &)>;

  RunSummary run();

  RunArtifacts artifact_paths() const;

  // Replaces the LightGBM backend for the training stage
  void set_backend_factory(BackendFactory factory);

private:
  bool cancellation_requested() const;
  void write_run_metrics(const std::filesystem::path &path) const;

  Config::AppConfig config_;
  const std::atomic<bool> *cancel_flag_;
  BackendFactory backend_factory_;
};

#endif // PIPELINE_RUNNER_HPP
