#include "training/gbdt_trainer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "training/early_stopping.hpp"
#include "utils/scoped_timer.hpp"

#include <cmath>

using json = nlohmann::json;

namespace training {

namespace {

constexpr int PROGRESS_LOG_INTERVAL = 50;

bool all_finite(const std::map<std::string, double> &metrics) {
  for (const auto &[name, value] : metrics)
    if (!std::isfinite(value))
      return false;
  return true;
}

} // namespace

json TrainingResult::history_json() const {
  json rounds = json::array();
  for (const auto &record : history)
    rounds.push_back({{"round", record.round},
                      {"train", record.metrics.train},
                      {"validation", record.metrics.validation}});
  return rounds;
}

GbdtTrainer::GbdtTrainer(const Config::TrainingConfig &config,
                         const std::atomic<bool> *cancel_flag)
    : config_(config), cancel_flag_(cancel_flag) {}

TrainingResult GbdtTrainer::run(IBoosterBackend &backend) const {
  static Histogram *round_timer = MetricsManager::instance().register_histogram(
      "ics_training_duration_seconds", "Wall time of one training run.");
  ScopedTimer timer(*round_timer);

  EarlyStoppingMonitor monitor(config_.early_stopping_rounds, config_.min_delta);
  TrainingResult result;
  result.monitor_metric = config_.monitor_metric;

  LOG(LogLevel::INFO, LogComponent::TRAIN,
      "Training with " << backend.get_name() << ": up to " << config_.max_rounds
                       << " rounds, early stopping on validation "
                       << config_.monitor_metric << " (patience "
                       << config_.early_stopping_rounds << ")");

  for (int round = 1; round <= config_.max_rounds; ++round) {
    if (cancel_flag_ != nullptr && cancel_flag_->load()) {
      LOG(LogLevel::WARN, LogComponent::TRAIN,
          "Cancellation requested, stopping after round " << round - 1);
      break;
    }

    const bool finished = backend.update_one_round();
    if (finished && monitor.best_round() > 0) {
      LOG(LogLevel::INFO, LogComponent::TRAIN,
          "No further splits possible at round " << round
                                                 << ", stopping training");
      break;
    }

    RoundEvaluation metrics = backend.evaluate();
    if (!all_finite(metrics.train) || !all_finite(metrics.validation)) {
      std::string best_model;
      if (monitor.best_round() > 0)
        best_model = backend.export_model(monitor.best_round());
      LOG(LogLevel::ERROR, LogComponent::TRAIN,
          "Non-finite loss at round " << round << ", best round so far "
                                      << monitor.best_round());
      throw TrainingDivergedError(round, round - 1, monitor.best_round(),
                                  std::move(best_model));
    }

    auto it = metrics.validation.find(config_.monitor_metric);
    if (it == metrics.validation.end())
      throw PipelineError("backend does not report validation metric '" +
                          config_.monitor_metric + "'");
    const double monitored = it->second;

    result.history.push_back({round, metrics});
    result.rounds_completed = round;

    if (round % PROGRESS_LOG_INTERVAL == 0)
      LOG(LogLevel::INFO, LogComponent::TRAIN,
          "[" << round << "] valid " << config_.monitor_metric << ": "
              << monitored);
    else
      LOG(LogLevel::DEBUG, LogComponent::TRAIN,
          "[" << round << "] valid " << config_.monitor_metric << ": "
              << monitored);

    if (monitor.update(round, monitored)) {
      result.stopped_early = true;
      LOG(LogLevel::INFO, LogComponent::TRAIN,
          "Early stopping at round " << round << ", best round "
                                     << monitor.best_round() << " ("
                                     << config_.monitor_metric << " "
                                     << monitor.best_value() << ")");
      break;
    }

    // Only reached for the first round: its constant trees are the model
    if (finished) {
      LOG(LogLevel::WARN, LogComponent::TRAIN,
          "No splits possible in round 1, keeping the constant model");
      break;
    }
  }

  if (monitor.best_round() == 0)
    throw PipelineError("training finished without a single boosting round");

  result.best_round = monitor.best_round();
  result.best_score = monitor.best_value();
  result.model_text = backend.export_model(result.best_round);

  LOG(LogLevel::INFO, LogComponent::TRAIN,
      "Training done: " << result.rounds_completed << " rounds, keeping "
                        << result.best_round);
  return result;
}

} // namespace training
