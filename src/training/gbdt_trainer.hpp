#ifndef GBDT_TRAINER_HPP
#define GBDT_TRAINER_HPP

#include "core/config.hpp"
#include "training/booster_backend.hpp"

#include <atomic>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace training {

struct RoundRecord {
  int round = 0;
  RoundEvaluation metrics;
};

struct TrainingResult {
  // Text model truncated to best_round
  std::string model_text;
  std::string monitor_metric;
  int best_round = 0;
  double best_score = 0.0;
  int rounds_completed = 0;
  bool stopped_early = false;
  std::vector<RoundRecord> history;

  nlohmann::json history_json() const;
};

// Drives a boosting backend round by round, watching the configured
// validation metric for early stopping.
class GbdtTrainer {
public:
  explicit GbdtTrainer(const Config::TrainingConfig &config,
                       const std::atomic<bool> *cancel_flag = nullptr);

  // Throws TrainingDivergedError when a loss turns non-finite and
  // PipelineError when no round could be trained.
  TrainingResult run(IBoosterBackend &backend) const;

private:
  Config::TrainingConfig config_;
  const std::atomic<bool> *cancel_flag_;
};

} // namespace training

#endif // GBDT_TRAINER_HPP
