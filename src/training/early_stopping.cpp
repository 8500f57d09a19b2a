#include "training/early_stopping.hpp"

namespace training {

EarlyStoppingMonitor::EarlyStoppingMonitor(int patience, double min_delta)
    : patience_(patience), min_delta_(min_delta < 0.0 ? -min_delta : min_delta) {}

bool EarlyStoppingMonitor::update(int round, double value) {
  if (best_round_ == 0 || value < best_value_ - min_delta_) {
    best_round_ = round;
    best_value_ = value;
    stale_rounds_ = 0;
    return false;
  }

  ++stale_rounds_;
  return patience_ > 0 && stale_rounds_ >= patience_;
}

} // namespace training
