#include "dataset/data_splitter.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <string>

namespace dataset {

DataSplitter::DataSplitter(const Config::SplitConfig &config)
    : test_fraction_(config.test_fraction),
      validation_fraction_(config.validation_fraction), seed_(config.seed) {}

std::vector<SplitPart>
DataSplitter::assign(const std::vector<std::string> &labels) const {
  // std::map keeps classes in a fixed order so the RNG stream is reproducible
  std::map<std::string, std::vector<size_t>> by_class;
  for (size_t i = 0; i < labels.size(); ++i)
    by_class[labels[i]].push_back(i);

  std::vector<SplitPart> parts(labels.size(), SplitPart::TRAIN);
  std::mt19937_64 rng(seed_);

  for (auto &[label, indices] : by_class) {
    std::shuffle(indices.begin(), indices.end(), rng);
    const size_t n = indices.size();
    const auto n_test =
        static_cast<size_t>(std::floor(static_cast<double>(n) * test_fraction_));
    const auto n_val = static_cast<size_t>(
        std::floor(static_cast<double>(n) * validation_fraction_));

    for (size_t i = 0; i < n_test; ++i)
      parts[indices[i]] = SplitPart::TEST;
    for (size_t i = n_test; i < n_test + n_val && i < n; ++i)
      parts[indices[i]] = SplitPart::VALIDATION;

    if (n_test + n_val >= n)
      LOG(LogLevel::WARN, LogComponent::DATA_SPLIT,
          "Class '" << label << "' has " << n
                    << " rows, none left for training");
  }
  return parts;
}

DatasetSplits DataSplitter::split(const LabeledMatrix &data) const {
  std::vector<SplitPart> parts = assign(data.labels);

  std::vector<size_t> train_idx;
  std::vector<size_t> val_idx;
  std::vector<size_t> test_idx;
  for (size_t i = 0; i < parts.size(); ++i) {
    switch (parts[i]) {
    case SplitPart::TRAIN:
      train_idx.push_back(i);
      break;
    case SplitPart::VALIDATION:
      val_idx.push_back(i);
      break;
    case SplitPart::TEST:
      test_idx.push_back(i);
      break;
    }
  }

  if (train_idx.empty() || val_idx.empty() || test_idx.empty())
    throw PipelineError("stratified split left a part empty (train " +
                        std::to_string(train_idx.size()) + ", validation " +
                        std::to_string(val_idx.size()) + ", test " +
                        std::to_string(test_idx.size()) +
                        "); adjust the split fractions or add rows");

  DatasetSplits splits;
  splits.train = data.select_rows(train_idx);
  splits.validation = data.select_rows(val_idx);
  splits.test = data.select_rows(test_idx);

  LOG(LogLevel::INFO, LogComponent::DATA_SPLIT,
      "Split " << data.rows() << " rows: train " << train_idx.size()
               << ", validation " << val_idx.size() << ", test "
               << test_idx.size() << " (seed " << seed_ << ")");
  return splits;
}

} // namespace dataset
