#ifndef DATASET_LOADER_HPP
#define DATASET_LOADER_HPP

#include "core/config.hpp"

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace dataset {

struct SourceTable {
  std::filesystem::path path;
  std::string class_label;
  int time_window = 0;
  size_t row_count = 0;
};

// Where a merged row came from: index into MergedDataset::sources and the
// data row within that file (0-based, header excluded).
struct RowOrigin {
  size_t source = 0;
  size_t row = 0;
};

// All sample tables of one time window stacked into a single table. Columns
// are the union of every file's header in first-seen order; a cell absent
// from a file's header is an empty (missing) string.
struct MergedDataset {
  int time_window = 0;
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> labels;
  std::vector<RowOrigin> origins;
  std::vector<SourceTable> sources;

  size_t row_count() const { return rows.size(); }
  std::set<std::string> class_labels() const;
  // -1 if the column is absent
  int column_index(const std::string &name) const;
};

class DatasetLoader {
public:
  DatasetLoader(std::filesystem::path data_dir, std::string benign_class,
                std::string label_column);

  explicit DatasetLoader(const Config::DatasetConfig &config);

  // Sample files of `time_window` under data_dir, recursively, sorted by path
  std::vector<SourceTable> discover(int time_window) const;

  // Throws DatasetIncompleteError when the window has no benign table or no
  // attack table.
  MergedDataset load(int time_window) const;

private:
  std::filesystem::path data_dir_;
  std::string benign_class_;
  std::string label_column_;
};

// Every window of one study must carry the same class set. Throws
// DatasetIncompleteError naming the first window that differs. For callers
// that load several windows; PipelineRunner handles a single window per run.
void check_label_consistency(const std::vector<MergedDataset> &windows);

} // namespace dataset

#endif // DATASET_LOADER_HPP
