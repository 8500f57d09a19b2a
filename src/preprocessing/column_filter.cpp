#include "preprocessing/column_filter.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "dataset/cell_value.hpp"

#include <limits>
#include <utility>

using json = nlohmann::json;

namespace preprocessing {

ColumnFilter::ColumnFilter(dataset::FeatureSchema schema)
    : schema_(std::move(schema)) {}

dataset::LabeledMatrix
ColumnFilter::apply(const dataset::MergedDataset &data) const {
  const auto &numeric = schema_.numeric_columns();
  if (numeric.empty())
    throw SchemaError("<none>", "schema declares no numeric feature columns");

  std::vector<size_t> source_cols;
  source_cols.reserve(numeric.size());
  for (const auto &column : numeric) {
    int idx = data.column_index(column);
    if (idx < 0)
      throw SchemaError(column, "missing from window " +
                                    std::to_string(data.time_window));
    source_cols.push_back(static_cast<size_t>(idx));
  }

  dataset::LabeledMatrix out;
  out.features.feature_names = numeric;
  out.features.rows = data.row_count();
  out.features.values.reserve(data.row_count() * numeric.size());
  size_t missing = 0;

  for (const auto &row : data.rows) {
    for (size_t c = 0; c < source_cols.size(); ++c) {
      dataset::ParsedCell cell = dataset::parse_cell(row[source_cols[c]]);
      switch (cell.kind) {
      case dataset::CellKind::NUMBER:
        out.features.values.push_back(cell.value);
        break;
      case dataset::CellKind::MISSING:
        out.features.values.push_back(
            std::numeric_limits<double>::quiet_NaN());
        ++missing;
        break;
      case dataset::CellKind::TEXT:
        throw SchemaError(numeric[c], "non-numeric value '" +
                                          row[source_cols[c]] + "'");
      }
    }
  }
  out.labels = data.labels;
  out.origins = data.origins;

  LOG(LogLevel::INFO, LogComponent::PREPROCESS,
      "Column filter kept " << numeric.size() << " of " << data.columns.size()
                            << " columns, " << missing << " missing cells");
  return out;
}

json ColumnFilter::to_json() const {
  return {{"stage", "column_filter"},
          {"numeric_columns", schema_.numeric_columns()},
          {"dropped_categorical", schema_.categorical_columns()},
          {"excluded", schema_.excluded_columns()},
          {"schema_inferred", schema_.inferred()}};
}

} // namespace preprocessing
