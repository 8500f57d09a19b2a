#include "evaluation/classification_metrics.hpp"
#include "core/errors.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace evaluation {

namespace {

double safe_ratio(double num, double den) { return den > 0.0 ? num / den : 0.0; }

} // namespace

ClassificationReport
compute_classification_report(const std::vector<int> &truth,
                              const std::vector<int> &predicted,
                              const std::vector<std::string> &class_names) {
  if (truth.size() != predicted.size())
    throw PipelineError("truth and prediction counts differ (" +
                        std::to_string(truth.size()) + " vs " +
                        std::to_string(predicted.size()) + ")");

  const size_t k = class_names.size();
  ClassificationReport report;
  report.class_names = class_names;
  report.confusion.assign(k, std::vector<size_t>(k, 0));
  report.total = truth.size();

  size_t correct = 0;
  for (size_t i = 0; i < truth.size(); ++i) {
    if (truth[i] < 0 || static_cast<size_t>(truth[i]) >= k ||
        predicted[i] < 0 || static_cast<size_t>(predicted[i]) >= k)
      throw PipelineError("class id out of range at row " + std::to_string(i));
    ++report.confusion[static_cast<size_t>(truth[i])]
                      [static_cast<size_t>(predicted[i])];
    if (truth[i] == predicted[i])
      ++correct;
  }

  double f1_sum = 0.0;
  double weighted_sum = 0.0;
  for (size_t c = 0; c < k; ++c) {
    size_t tp = report.confusion[c][c];
    size_t predicted_c = 0;
    size_t actual_c = 0;
    for (size_t o = 0; o < k; ++o) {
      predicted_c += report.confusion[o][c];
      actual_c += report.confusion[c][o];
    }

    ClassMetrics m;
    m.label = class_names[c];
    m.support = actual_c;
    m.precision = safe_ratio(static_cast<double>(tp),
                             static_cast<double>(predicted_c));
    m.recall =
        safe_ratio(static_cast<double>(tp), static_cast<double>(actual_c));
    m.f1 = safe_ratio(2.0 * m.precision * m.recall, m.precision + m.recall);

    f1_sum += m.f1;
    weighted_sum += m.f1 * static_cast<double>(actual_c);
    report.per_class.push_back(m);
  }

  report.accuracy = safe_ratio(static_cast<double>(correct),
                               static_cast<double>(report.total));
  report.macro_f1 = k > 0 ? f1_sum / static_cast<double>(k) : 0.0;
  report.weighted_f1 =
      safe_ratio(weighted_sum, static_cast<double>(report.total));
  return report;
}

json ClassificationReport::to_json() const {
  json classes = json::array();
  for (const auto &m : per_class)
    classes.push_back({{"class", m.label},
                       {"precision", m.precision},
                       {"recall", m.recall},
                       {"f1", m.f1},
                       {"support", m.support}});

  return {{"accuracy", accuracy},
          {"macro_f1", macro_f1},
          {"weighted_f1", weighted_f1},
          {"total", total},
          {"per_class", classes},
          {"confusion_matrix",
           {{"labels", class_names}, {"rows_truth_cols_predicted", confusion}}}};
}

std::vector<FeatureImportance>
rank_feature_importance(const std::vector<std::string> &features,
                        const std::vector<double> &scores) {
  if (features.size() != scores.size())
    throw PipelineError("feature and importance counts differ");

  std::vector<FeatureImportance> ranking;
  ranking.reserve(features.size());
  for (size_t i = 0; i < features.size(); ++i)
    ranking.push_back({features[i], scores[i]});

  std::sort(ranking.begin(), ranking.end(),
            [](const FeatureImportance &a, const FeatureImportance &b) {
              if (a.score != b.score)
                return a.score > b.score;
              return a.feature < b.feature;
            });
  return ranking;
}

} // namespace evaluation
