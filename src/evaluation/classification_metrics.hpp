#ifndef CLASSIFICATION_METRICS_HPP
#define CLASSIFICATION_METRICS_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace evaluation {

struct ClassMetrics {
  std::string label;
  double precision = 0.0;
  double recall = 0.0;
  double f1 = 0.0;
  size_t support = 0;
};

struct ClassificationReport {
  std::vector<std::string> class_names;
  std::vector<ClassMetrics> per_class;
  // confusion[truth][predicted]
  std::vector<std::vector<size_t>> confusion;
  double accuracy = 0.0;
  double macro_f1 = 0.0;
  double weighted_f1 = 0.0;
  size_t total = 0;

  nlohmann::json to_json() const;
};

// Ids index into class_names. A class never predicted has precision 0; a
// class absent from the truth has recall 0.
ClassificationReport
compute_classification_report(const std::vector<int> &truth,
                              const std::vector<int> &predicted,
                              const std::vector<std::string> &class_names);

struct FeatureImportance {
  std::string feature;
  double score = 0.0;
};

// Descending by score, ties broken by feature name
std::vector<FeatureImportance>
rank_feature_importance(const std::vector<std::string> &features,
                        const std::vector<double> &scores);

} // namespace evaluation

#endif // CLASSIFICATION_METRICS_HPP
