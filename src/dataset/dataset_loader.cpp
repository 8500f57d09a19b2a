#include "dataset/dataset_loader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "dataset/csv_reader.hpp"
#include "dataset/sample_file.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace dataset {

namespace {

std::string join_labels(const std::set<std::string> &labels) {
  std::ostringstream oss;
  bool first = true;
  for (const auto &label : labels) {
    oss << (first ? "" : ", ") << label;
    first = false;
  }
  return oss.str();
}

} // namespace

std::set<std::string> MergedDataset::class_labels() const {
  return std::set<std::string>(labels.begin(), labels.end());
}

int MergedDataset::column_index(const std::string &name) const {
  auto it = std::find(columns.begin(), columns.end(), name);
  return it == columns.end() ? -1 : static_cast<int>(it - columns.begin());
}

DatasetLoader::DatasetLoader(std::filesystem::path data_dir,
                             std::string benign_class, std::string label_column)
    : data_dir_(std::move(data_dir)),
      benign_class_(Utils::to_lower_copy(benign_class)),
      label_column_(std::move(label_column)) {}

DatasetLoader::DatasetLoader(const Config::DatasetConfig &config)
    : DatasetLoader(config.data_dir.empty() ? config.extract_dir
                                            : config.data_dir,
                    config.benign_class, config.label_column) {}

std::vector<SourceTable> DatasetLoader::discover(int time_window) const {
  std::vector<SourceTable> tables;
  std::error_code ec;
  if (!std::filesystem::is_directory(data_dir_, ec))
    return tables;

  for (const auto &entry :
       std::filesystem::recursive_directory_iterator(data_dir_)) {
    if (!entry.is_regular_file())
      continue;
    auto info = parse_sample_file_name(entry.path());
    if (!info || info->time_window != time_window)
      continue;

    SourceTable table;
    table.path = entry.path();
    table.class_label = info->class_label;
    table.time_window = info->time_window;
    tables.push_back(std::move(table));
  }

  std::sort(tables.begin(), tables.end(),
            [](const SourceTable &a, const SourceTable &b) {
              return a.path < b.path;
            });
  return tables;
}

MergedDataset DatasetLoader::load(int time_window) const {
  std::vector<SourceTable> tables = discover(time_window);

  bool has_benign = false;
  bool has_attack = false;
  for (const auto &table : tables) {
    if (table.class_label == benign_class_)
      has_benign = true;
    else
      has_attack = true;
  }
  if (!has_benign)
    throw DatasetIncompleteError(time_window,
                                 "no '" + benign_class_ + "' sample file in " +
                                     data_dir_.string());
  if (!has_attack)
    throw DatasetIncompleteError(time_window,
                                 "no attack sample file in " +
                                     data_dir_.string());

  MergedDataset merged;
  merged.time_window = time_window;

  std::unordered_map<std::string, size_t> column_positions;
  std::vector<RawTable> raw_tables;
  raw_tables.reserve(tables.size());

  for (auto &table : tables) {
    RawTable raw = read_csv(table.path);
    for (const auto &column : raw.header) {
      // The file name is authoritative for the class; an embedded label
      // column is dropped so it can never leak into the features.
      if (column == label_column_)
        continue;
      if (column_positions.emplace(column, merged.columns.size()).second)
        merged.columns.push_back(column);
    }
    table.row_count = raw.rows.size();
    LOG(LogLevel::INFO, LogComponent::DATA_LOADER,
        "Loaded " << table.row_count << " rows of class '"
                  << table.class_label << "' from "
                  << table.path.filename().string());
    merged.sources.push_back(table);
    raw_tables.push_back(std::move(raw));
  }

  for (size_t s = 0; s < raw_tables.size(); ++s) {
    const RawTable &raw = raw_tables[s];

    std::vector<int> target(raw.header.size(), -1);
    for (size_t c = 0; c < raw.header.size(); ++c) {
      auto it = column_positions.find(raw.header[c]);
      if (it != column_positions.end())
        target[c] = static_cast<int>(it->second);
    }

    for (size_t r = 0; r < raw.rows.size(); ++r) {
      std::vector<std::string> row(merged.columns.size());
      for (size_t c = 0; c < raw.rows[r].size(); ++c)
        if (target[c] >= 0)
          row[static_cast<size_t>(target[c])] = raw.rows[r][c];
      merged.rows.push_back(std::move(row));
      merged.labels.push_back(merged.sources[s].class_label);
      merged.origins.push_back({s, r});
    }
  }

  auto *rows_gauge = MetricsManager::instance().register_gauge(
      "ics_dataset_rows", "Rows in the merged dataset of the current window.");
  rows_gauge->set(static_cast<double>(merged.row_count()));

  LOG(LogLevel::INFO, LogComponent::DATA_LOADER,
      "Merged " << merged.sources.size() << " files for window "
                << time_window << "s: " << merged.row_count() << " rows, "
                << merged.columns.size() << " columns, classes ["
                << join_labels(merged.class_labels()) << "]");
  return merged;
}

void check_label_consistency(const std::vector<MergedDataset> &windows) {
  if (windows.empty())
    return;
  const std::set<std::string> reference = windows.front().class_labels();
  for (const auto &window : windows) {
    std::set<std::string> labels = window.class_labels();
    if (labels != reference)
      throw DatasetIncompleteError(
          window.time_window, "class set [" + join_labels(labels) +
                                  "] differs from window " +
                                  std::to_string(windows.front().time_window) +
                                  " [" + join_labels(reference) + "]");
  }
}

} // namespace dataset
