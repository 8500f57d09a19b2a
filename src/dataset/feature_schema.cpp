#include "dataset/feature_schema.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "dataset/cell_value.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace dataset {

namespace {

bool contains(const std::vector<std::string> &list, const std::string &name) {
  return std::find(list.begin(), list.end(), name) != list.end();
}

} // namespace

FeatureSchema::FeatureSchema(std::vector<std::string> numeric_columns,
                             std::vector<std::string> categorical_columns,
                             std::vector<std::string> excluded_columns)
    : numeric_(std::move(numeric_columns)),
      categorical_(std::move(categorical_columns)),
      excluded_(std::move(excluded_columns)) {
  std::unordered_set<std::string> seen;
  for (const auto *list : {&numeric_, &categorical_})
    for (const auto &column : *list)
      if (!seen.insert(column).second)
        throw SchemaError(column, "declared more than once in the schema");
}

FeatureSchema
FeatureSchema::infer(const MergedDataset &data,
                     const std::vector<std::string> &excluded_columns) {
  std::vector<std::string> numeric;
  std::vector<std::string> categorical;

  for (size_t c = 0; c < data.columns.size(); ++c) {
    const std::string &column = data.columns[c];
    if (contains(excluded_columns, column))
      continue;

    bool is_numeric = true;
    for (const auto &row : data.rows) {
      if (parse_cell(row[c]).kind == CellKind::TEXT) {
        is_numeric = false;
        break;
      }
    }
    (is_numeric ? numeric : categorical).push_back(column);
  }

  FeatureSchema schema(std::move(numeric), std::move(categorical),
                       excluded_columns);
  schema.inferred_ = true;
  LOG(LogLevel::INFO, LogComponent::DATA_LOADER,
      "Inferred schema from window " << data.time_window << ": "
                                     << schema.numeric_.size() << " numeric, "
                                     << schema.categorical_.size()
                                     << " categorical columns");
  return schema;
}

FeatureSchema FeatureSchema::resolve(const Config::SchemaConfig &config,
                                     const std::string &label_column,
                                     const MergedDataset &data) {
  std::vector<std::string> excluded = config.excluded_columns;
  if (!contains(excluded, label_column))
    excluded.push_back(label_column);

  if (config.numeric_columns.empty())
    return infer(data, excluded);
  return FeatureSchema(config.numeric_columns, config.categorical_columns,
                       excluded);
}

void FeatureSchema::validate(const MergedDataset &data) const {
  for (const auto *list : {&numeric_, &categorical_})
    for (const auto &column : *list)
      if (data.column_index(column) < 0)
        throw SchemaError(column, "declared in the schema but missing from "
                                  "window " +
                                      std::to_string(data.time_window));

  for (size_t c = 0; c < data.columns.size(); ++c) {
    const std::string &column = data.columns[c];
    if (contains(excluded_, column) || contains(categorical_, column))
      continue;
    if (!contains(numeric_, column))
      throw SchemaError(column, "not declared in the schema (window " +
                                    std::to_string(data.time_window) + ")");

    for (size_t r = 0; r < data.rows.size(); ++r) {
      if (parse_cell(data.rows[r][c]).kind == CellKind::TEXT) {
        const RowOrigin &origin = data.origins[r];
        throw SchemaError(column,
                          "non-numeric value '" + data.rows[r][c] + "' in " +
                              data.sources[origin.source].path.filename()
                                  .string() +
                              " row " + std::to_string(origin.row + 1));
      }
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::DATA_LOADER,
      "Schema validated against window " << data.time_window);
}

} // namespace dataset
