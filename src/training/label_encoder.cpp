#include "training/label_encoder.hpp"
#include "core/errors.hpp"

#include <algorithm>

namespace training {

LabelEncoder::LabelEncoder(const std::set<std::string> &classes)
    : classes_(classes.begin(), classes.end()) {}

LabelEncoder::LabelEncoder(std::vector<std::string> classes)
    : classes_(std::move(classes)) {
  std::sort(classes_.begin(), classes_.end());
  classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());
}

int LabelEncoder::encode(const std::string &label) const {
  auto it = std::lower_bound(classes_.begin(), classes_.end(), label);
  if (it == classes_.end() || *it != label)
    throw PipelineError("unknown class label '" + label + "'");
  return static_cast<int>(it - classes_.begin());
}

const std::string &LabelEncoder::decode(int id) const {
  if (id < 0 || static_cast<size_t>(id) >= classes_.size())
    throw PipelineError("class id " + std::to_string(id) + " out of range");
  return classes_[static_cast<size_t>(id)];
}

} // namespace training
