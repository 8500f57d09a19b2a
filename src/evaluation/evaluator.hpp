#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "dataset/feature_matrix.hpp"
#include "evaluation/classification_metrics.hpp"
#include "training/trained_ensemble.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace evaluation {

struct EvaluationReport {
  int time_window = 0;
  std::string importance_type;
  ClassificationReport classification;
  std::vector<FeatureImportance> importance;

  nlohmann::json to_json() const;
  void write_json(const std::string &path) const;
  // "feature,importance" header followed by the ranking
  void write_importance_csv(const std::string &path) const;
};

class Evaluator {
public:
  explicit Evaluator(training::ImportanceType importance_type);

  EvaluationReport evaluate(const training::TrainedEnsemble &model,
                            const dataset::LabeledMatrix &test,
                            int time_window) const;

  // Scoring part of evaluate(), for predictions obtained elsewhere
  EvaluationReport
  evaluate_predictions(const std::vector<std::string> &class_names,
                       const std::vector<int> &truth,
                       const std::vector<int> &predicted,
                       const std::vector<std::string> &features,
                       const std::vector<double> &importance,
                       int time_window) const;

private:
  training::ImportanceType importance_type_;
};

} // namespace evaluation

#endif // EVALUATOR_HPP
