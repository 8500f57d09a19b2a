#ifndef LABEL_ENCODER_HPP
#define LABEL_ENCODER_HPP

#include <set>
#include <string>
#include <vector>

namespace training {

// Maps class names to contiguous ids 0..K-1 in lexicographic order, so the
// ids of a class set never depend on row order.
class LabelEncoder {
public:
  LabelEncoder() = default;
  explicit LabelEncoder(const std::set<std::string> &classes);
  explicit LabelEncoder(std::vector<std::string> classes);

  // Throws PipelineError for a label outside the fitted class set
  int encode(const std::string &label) const;
  const std::string &decode(int id) const;

  const std::vector<std::string> &classes() const { return classes_; }
  size_t size() const { return classes_.size(); }

private:
  std::vector<std::string> classes_;
};

} // namespace training

#endif // LABEL_ENCODER_HPP
