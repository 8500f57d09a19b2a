#include "dataset/csv_reader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <unordered_set>

namespace dataset {

namespace {

// Quoted fields may span lines; keep reading until the quotes balance.
bool read_record(std::istream &in, std::string &record) {
  record.clear();
  std::string line;
  bool in_quotes = false;
  bool any = false;
  while (std::getline(in, line)) {
    any = true;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (!record.empty() || in_quotes)
      record += '\n';
    record += line;
    for (char c : line)
      if (c == '"')
        in_quotes = !in_quotes;
    if (!in_quotes)
      return true;
  }
  return any;
}

} // namespace

std::vector<std::string> split_csv_record(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else {
      field += c;
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

RawTable read_csv(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw PipelineError("Could not open CSV file: " + path.string());

  RawTable table;
  table.source = path;

  std::string record;
  if (!read_record(in, record))
    throw PipelineError("CSV file has no header row: " + path.string());

  // Strip a UTF-8 byte order mark
  if (Utils::starts_with(record, "\xEF\xBB\xBF"))
    record.erase(0, 3);

  std::unordered_set<std::string> seen;
  for (auto &name : split_csv_record(record)) {
    std::string column = Utils::trim_copy(name);
    if (!seen.insert(column).second)
      throw SchemaError(column, "duplicate header in " + path.string());
    table.header.push_back(std::move(column));
  }

  size_t line_num = 1;
  while (read_record(in, record)) {
    ++line_num;
    if (Utils::trim_copy(record).empty())
      continue;

    std::vector<std::string> cells = split_csv_record(record);
    if (cells.size() > table.header.size())
      throw PipelineError(path.string() + ":" + std::to_string(line_num) +
                          ": row has " + std::to_string(cells.size()) +
                          " fields, header has " +
                          std::to_string(table.header.size()));
    cells.resize(table.header.size());
    table.rows.push_back(std::move(cells));
  }

  LOG(LogLevel::DEBUG, LogComponent::DATA_LOADER,
      "Read " << table.rows.size() << " rows x " << table.header.size()
              << " columns from " << path.filename().string());
  return table;
}

} // namespace dataset
