#ifndef CSV_READER_HPP
#define CSV_READER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace dataset {

struct RawTable {
  std::filesystem::path source;
  std::vector<std::string> header;
  // Every row has exactly header.size() cells; short rows are padded with
  // empty (missing) cells.
  std::vector<std::vector<std::string>> rows;
};

// Splits one CSV record, honouring double-quoted fields with "" escapes.
std::vector<std::string> split_csv_record(const std::string &line);

// Reads a comma-separated file with a header row. Throws PipelineError on
// unreadable files, duplicate header names or rows wider than the header.
RawTable read_csv(const std::filesystem::path &path);

} // namespace dataset

#endif // CSV_READER_HPP
