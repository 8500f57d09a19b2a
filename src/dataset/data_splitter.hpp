#ifndef DATA_SPLITTER_HPP
#define DATA_SPLITTER_HPP

#include "core/config.hpp"
#include "dataset/feature_matrix.hpp"

#include <cstddef>
#include <vector>

namespace dataset {

enum class SplitPart { TRAIN, VALIDATION, TEST };

struct DatasetSplits {
  LabeledMatrix train;
  LabeledMatrix validation;
  LabeledMatrix test;
};

// Stratified split: for every class, floor(n * test_fraction) rows go to
// test and floor(n * validation_fraction) to validation, the rest to train.
// Rows keep their original relative order within each part.
class DataSplitter {
public:
  explicit DataSplitter(const Config::SplitConfig &config);

  // Part assigned to every row, for a given label column
  std::vector<SplitPart> assign(const std::vector<std::string> &labels) const;

  // Throws PipelineError if any part ends up empty
  DatasetSplits split(const LabeledMatrix &data) const;

private:
  double test_fraction_;
  double validation_fraction_;
  uint64_t seed_;
};

} // namespace dataset

#endif // DATA_SPLITTER_HPP
