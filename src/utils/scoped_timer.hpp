#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include "core/logger.hpp"
#include "core/metrics_manager.hpp"

#include <chrono>
#include <string>
#include <utility>

// Records the lifetime of the enclosing scope into a histogram. When a stage
// name is given, the duration is also logged at INFO under CORE.
class ScopedTimer {
public:
  explicit ScopedTimer(Histogram &histogram_metric, std::string stage = {})
      : metric_(histogram_metric), stage_(std::move(stage)),
        start_time_(std::chrono::steady_clock::now()) {}

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

  double elapsed_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start_time_)
        .count();
  }

  ~ScopedTimer() {
    double seconds = elapsed_seconds();
    metric_.observe(seconds);
    if (!stage_.empty())
      LOG(LogLevel::INFO, LogComponent::CORE,
          "Stage '" << stage_ << "' finished in " << std::fixed
                    << std::setprecision(3) << seconds << "s");
  }

private:
  Histogram &metric_;
  std::string stage_;
  std::chrono::time_point<std::chrono::steady_clock> start_time_;
};

#endif // SCOPED_TIMER_HPP
