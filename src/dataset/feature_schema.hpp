#ifndef FEATURE_SCHEMA_HPP
#define FEATURE_SCHEMA_HPP

#include "core/config.hpp"
#include "dataset/dataset_loader.hpp"

#include <set>
#include <string>
#include <vector>

namespace dataset {

class FeatureSchema {
public:
  FeatureSchema() = default;
  FeatureSchema(std::vector<std::string> numeric_columns,
                std::vector<std::string> categorical_columns,
                std::vector<std::string> excluded_columns = {});

  // A column is numeric when every non-missing cell parses as a number; an
  // entirely missing column counts as numeric so imputation can report it.
  static FeatureSchema infer(const MergedDataset &data,
                             const std::vector<std::string> &excluded_columns);

  // Declared columns from configuration, or inferred from `data` when the
  // configuration declares none.
  static FeatureSchema resolve(const Config::SchemaConfig &config,
                               const std::string &label_column,
                               const MergedDataset &data);

  // Throws SchemaError when a declared column is absent, a numeric column
  // holds text, or the table has a column the schema does not know.
  void validate(const MergedDataset &data) const;

  const std::vector<std::string> &numeric_columns() const { return numeric_; }
  const std::vector<std::string> &categorical_columns() const {
    return categorical_;
  }
  const std::vector<std::string> &excluded_columns() const { return excluded_; }
  bool inferred() const { return inferred_; }

private:
  std::vector<std::string> numeric_;
  std::vector<std::string> categorical_;
  std::vector<std::string> excluded_;
  bool inferred_ = false;
};

} // namespace dataset

#endif // FEATURE_SCHEMA_HPP
