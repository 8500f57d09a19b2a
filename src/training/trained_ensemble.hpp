#ifndef TRAINED_ENSEMBLE_HPP
#define TRAINED_ENSEMBLE_HPP

#include "dataset/feature_matrix.hpp"
#include "training/lightgbm_handles.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace training {

enum class ImportanceType { SPLIT, GAIN };

ImportanceType importance_type_from_string(const std::string &name);
const char *importance_type_to_string(ImportanceType type);

// A trained booster plus what is needed to interpret it: class names in id
// order, feature names in column order, and the training metadata.
// Immutable once constructed.
class TrainedEnsemble {
public:
  TrainedEnsemble(std::string model_text, std::vector<std::string> class_names,
                  std::vector<std::string> feature_names,
                  nlohmann::json metadata = nlohmann::json::object());

  // Reads a model written by save()
  static TrainedEnsemble load(const std::string &model_path,
                              const std::string &metadata_path);

  // Row-major probabilities, rows x num_classes()
  std::vector<double> predict_proba(const dataset::FeatureMatrix &matrix) const;
  // Class id with the highest probability for every row
  std::vector<int> predict(const dataset::FeatureMatrix &matrix) const;

  // One score per feature, in feature order
  std::vector<double> feature_importance(ImportanceType type) const;

  void save(const std::string &model_path,
            const std::string &metadata_path) const;

  nlohmann::json metadata_json() const;
  const std::string &model_text() const { return model_text_; }
  const std::vector<std::string> &class_names() const { return class_names_; }
  const std::vector<std::string> &feature_names() const {
    return feature_names_;
  }
  size_t num_classes() const { return class_names_.size(); }
  int num_rounds() const { return num_rounds_; }

private:
  std::string model_text_;
  std::vector<std::string> class_names_;
  std::vector<std::string> feature_names_;
  nlohmann::json metadata_;
  BoosterPtr booster_;
  int num_rounds_ = 0;
};

} // namespace training

#endif // TRAINED_ENSEMBLE_HPP
