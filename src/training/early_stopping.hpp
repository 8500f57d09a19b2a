#ifndef EARLY_STOPPING_HPP
#define EARLY_STOPPING_HPP

namespace training {

// Tracks a lower-is-better validation metric. A round improves only when it
// beats the best value by more than min_delta; after `patience` rounds
// without improvement the monitor asks to stop. patience <= 0 disables it.
class EarlyStoppingMonitor {
public:
  EarlyStoppingMonitor(int patience, double min_delta);

  // Records the metric of `round` (1-based). Returns true when training
  // should stop.
  bool update(int round, double value);

  int best_round() const { return best_round_; }
  double best_value() const { return best_value_; }
  int rounds_without_improvement() const { return stale_rounds_; }

private:
  int patience_;
  double min_delta_;
  int best_round_ = 0;
  double best_value_ = 0.0;
  int stale_rounds_ = 0;
};

} // namespace training

#endif // EARLY_STOPPING_HPP
