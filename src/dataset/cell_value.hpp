#ifndef CELL_VALUE_HPP
#define CELL_VALUE_HPP

#include <string_view>

namespace dataset {

enum class CellKind { MISSING, NUMBER, TEXT };

struct ParsedCell {
  CellKind kind = CellKind::MISSING;
  double value = 0.0;
};

// Empty cells, the usual NA spellings and non-finite numbers are missing.
bool is_missing_token(std::string_view raw);

ParsedCell parse_cell(std::string_view raw);

} // namespace dataset

#endif // CELL_VALUE_HPP
