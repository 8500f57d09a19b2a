#include "metrics_manager.hpp"
#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <string>

using json = nlohmann::json;

void Histogram::observe(double value) {
  // Update atomics first, as they don't require a heavy lock
  double current_sum = cumulative_sum_.load(std::memory_order_relaxed);
  while (!cumulative_sum_.compare_exchange_weak(
      current_sum, current_sum + value, std::memory_order_release,
      std::memory_order_relaxed))
    ;
  cumulative_count_.fetch_add(1, std::memory_order_relaxed);

  std::lock_guard<std::mutex> lock(mtx);
  if (observations_.size() < MAX_OBSERVATIONS)
    observations_.push_back(value);
}

std::vector<double> Histogram::get_observations() const {
  std::lock_guard<std::mutex> lock(mtx);
  return observations_;
}

double Histogram::get_cumulative_sum() const {
  return cumulative_sum_.load(std::memory_order_relaxed);
}

uint64_t Histogram::get_cumulative_count() const {
  return cumulative_count_.load(std::memory_order_relaxed);
}

void LabeledCounter::increment(const MetricLabels &labels, uint64_t value) {
  std::lock_guard<std::mutex> lock(series_mutex_);
  if (series_.find(labels) == series_.end()) {
    series_[labels] = std::make_unique<Series>();
  }
  series_[labels]->val.fetch_add(value, std::memory_order_relaxed);
}

uint64_t LabeledCounter::get_value(const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lock(series_mutex_);
  auto it = series_.find(labels);
  if (it == series_.end())
    return 0;
  return it->second->val.load(std::memory_order_relaxed);
}

MetricsManager &MetricsManager::instance() {
  static MetricsManager instance;
  return instance;
}

LabeledCounter *
MetricsManager::register_labeled_counter(const std::string &name,
                                         const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = labeled_counters_[name];
  if (!slot)
    slot = std::unique_ptr<LabeledCounter>(new LabeledCounter(name, help_text));
  return slot.get();
}

Gauge *MetricsManager::register_gauge(const std::string &name,
                                      const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = gauges_[name];
  if (!slot)
    slot = std::unique_ptr<Gauge>(new Gauge(name, help_text));
  return slot.get();
}

Histogram *MetricsManager::register_histogram(const std::string &name,
                                              const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = histograms_[name];
  if (!slot)
    slot = std::unique_ptr<Histogram>(new Histogram(name, help_text));
  return slot.get();
}

std::string MetricsManager::expose_as_json() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  json j;

  // --- General Info ---
  auto now = std::chrono::steady_clock::now();
  j["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  j["runtime_seconds"] =
      std::chrono::duration<double>(now - start_time_).count();

  // --- Labeled Counters ---
  json j_counters = json::object();
  for (const auto &[name, counter_ptr] : labeled_counters_) {
    json j_series = json::object();
    std::lock_guard<std::mutex> series_lock(counter_ptr->series_mutex_);
    uint64_t total = 0;

    for (const auto &[labels, series_ptr] : counter_ptr->series_) {
      // Create a key from labels, e.g., "outcome=extracted"
      std::string label_key;
      bool first_label = true;
      for (const auto &[key, val] : labels) {
        if (!first_label)
          label_key += ",";
        label_key += key + "=" + val;
        first_label = false;
      }

      uint64_t val = series_ptr->val.load(std::memory_order_relaxed);
      if (!label_key.empty())
        j_series[label_key] = val;
      total += val;
    }

    // Always include a 'total' for the entire metric.
    j_series["total"] = total;
    j_counters[name] = j_series;
  }
  j["counters"] = j_counters;

  // --- Gauges ---
  json j_gauges = json::object();
  for (const auto &[name, gauge_ptr] : gauges_)
    j_gauges[name] = gauge_ptr->get_value();
  j["gauges"] = j_gauges;

  // --- Histograms ---
  json j_histos = json::object();
  for (const auto &[name, histo_ptr] : histograms_) {
    json j_histo;
    j_histo["help"] = histo_ptr->help;
    j_histo["sum"] = histo_ptr->get_cumulative_sum();
    j_histo["count"] = histo_ptr->get_cumulative_count();
    j_histo["observations"] = histo_ptr->get_observations();
    j_histos[name] = j_histo;
  }
  j["histograms"] = j_histos;

  return j.dump(2);
}
