#ifndef COLUMN_FILTER_HPP
#define COLUMN_FILTER_HPP

#include "dataset/dataset_loader.hpp"
#include "dataset/feature_matrix.hpp"
#include "dataset/feature_schema.hpp"

#include <nlohmann/json.hpp>

namespace preprocessing {

// First transform stage: turns the merged string table into a numeric
// matrix holding the schema's numeric columns in declaration order.
// Categorical, label and excluded columns are dropped. Stateless.
class ColumnFilter {
public:
  explicit ColumnFilter(dataset::FeatureSchema schema);

  // Throws SchemaError if the schema has no numeric columns or a numeric
  // column holds text.
  dataset::LabeledMatrix apply(const dataset::MergedDataset &data) const;

  nlohmann::json to_json() const;
  const dataset::FeatureSchema &schema() const { return schema_; }

private:
  dataset::FeatureSchema schema_;
};

} // namespace preprocessing

#endif // COLUMN_FILTER_HPP
