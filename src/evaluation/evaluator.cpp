#include "evaluation/evaluator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <map>

using json = nlohmann::json;

namespace evaluation {

json EvaluationReport::to_json() const {
  json ranking = json::array();
  for (const auto &item : importance)
    ranking.push_back({{"feature", item.feature}, {"importance", item.score}});

  json report = classification.to_json();
  report["time_window"] = time_window;
  report["feature_importance"] = {{"type", importance_type},
                                  {"ranking", ranking}};
  return report;
}

void EvaluationReport::write_json(const std::string &path) const {
  Utils::create_directory_for_file(path);
  std::ofstream out(path);
  if (!out.is_open())
    throw PipelineError("Could not write evaluation report to " + path);
  out << to_json().dump(2) << "\n";
}

void EvaluationReport::write_importance_csv(const std::string &path) const {
  Utils::create_directory_for_file(path);
  std::ofstream out(path);
  if (!out.is_open())
    throw PipelineError("Could not write feature importance to " + path);

  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  out << "feature,importance\n";
  for (const auto &item : importance) {
    if (item.feature.find_first_of(",\"\n") != std::string::npos) {
      std::string quoted;
      for (char c : item.feature)
        quoted += c == '"' ? std::string("\"\"") : std::string(1, c);
      out << '"' << quoted << '"';
    } else {
      out << item.feature;
    }
    out << ',' << item.score << '\n';
  }
}

Evaluator::Evaluator(training::ImportanceType importance_type)
    : importance_type_(importance_type) {}

EvaluationReport
Evaluator::evaluate_predictions(const std::vector<std::string> &class_names,
                                const std::vector<int> &truth,
                                const std::vector<int> &predicted,
                                const std::vector<std::string> &features,
                                const std::vector<double> &importance,
                                int time_window) const {
  EvaluationReport report;
  report.time_window = time_window;
  report.importance_type = training::importance_type_to_string(importance_type_);
  report.classification =
      compute_classification_report(truth, predicted, class_names);
  report.importance = rank_feature_importance(features, importance);

  auto *accuracy = MetricsManager::instance().register_gauge(
      "ics_test_accuracy", "Accuracy on the held-out test split.");
  accuracy->set(report.classification.accuracy);
  auto *macro_f1 = MetricsManager::instance().register_gauge(
      "ics_test_macro_f1", "Macro-averaged F1 on the held-out test split.");
  macro_f1->set(report.classification.macro_f1);

  LOG(LogLevel::INFO, LogComponent::EVAL,
      "Test accuracy " << report.classification.accuracy << ", macro F1 "
                       << report.classification.macro_f1 << ", weighted F1 "
                       << report.classification.weighted_f1 << " over "
                       << report.classification.total << " rows");
  for (const auto &m : report.classification.per_class)
    LOG(LogLevel::DEBUG, LogComponent::EVAL,
        m.label << ": precision " << m.precision << " recall " << m.recall
                << " f1 " << m.f1 << " support " << m.support);
  return report;
}

EvaluationReport Evaluator::evaluate(const training::TrainedEnsemble &model,
                                     const dataset::LabeledMatrix &test,
                                     int time_window) const {
  if (test.features.feature_names != model.feature_names())
    throw PipelineError("test matrix columns differ from the model features");

  std::map<std::string, int> class_ids;
  for (size_t i = 0; i < model.class_names().size(); ++i)
    class_ids[model.class_names()[i]] = static_cast<int>(i);

  std::vector<int> truth;
  truth.reserve(test.labels.size());
  for (const auto &label : test.labels) {
    auto it = class_ids.find(label);
    if (it == class_ids.end())
      throw PipelineError("test label '" + label + "' unknown to the model");
    truth.push_back(it->second);
  }
  std::vector<int> predicted = model.predict(test.features);

  return evaluate_predictions(model.class_names(), truth, predicted,
                              model.feature_names(),
                              model.feature_importance(importance_type_),
                              time_window);
}

} // namespace evaluation
