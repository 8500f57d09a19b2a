#ifndef LIGHTGBM_BACKEND_HPP
#define LIGHTGBM_BACKEND_HPP

#include "core/config.hpp"
#include "dataset/feature_matrix.hpp"
#include "training/booster_backend.hpp"
#include "training/label_encoder.hpp"
#include "training/lightgbm_handles.hpp"

#include <string>
#include <vector>

namespace training {

// Boosting parameters for the multiclass objective. Feature names are not
// passed to LightGBM; they travel in the model metadata instead.
std::string build_lightgbm_parameters(const Config::TrainingConfig &config,
                                      size_t num_classes);

class LightGbmBackend : public IBoosterBackend {
public:
  LightGbmBackend(const Config::TrainingConfig &config,
                  const dataset::LabeledMatrix &train,
                  const dataset::LabeledMatrix &validation,
                  const LabelEncoder &encoder);

  const char *get_name() const override { return "lightgbm"; }
  bool update_one_round() override;
  RoundEvaluation evaluate() const override;
  std::string export_model(int num_rounds) const override;

  const std::string &parameters() const { return parameters_; }

private:
  DatasetPtr make_dataset(const dataset::LabeledMatrix &data,
                          const LabelEncoder &encoder,
                          DatasetHandle reference) const;
  std::map<std::string, double> read_eval(int data_idx) const;

  std::string parameters_;
  // LightGBM reports metrics in the order they are configured
  std::vector<std::string> metric_names_;
  DatasetPtr train_data_;
  DatasetPtr validation_data_;
  BoosterPtr booster_;
};

} // namespace training

#endif // LIGHTGBM_BACKEND_HPP
