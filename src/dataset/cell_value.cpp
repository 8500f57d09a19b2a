#include "dataset/cell_value.hpp"
#include "utils/utils.hpp"

#include <array>
#include <cmath>
#include <string>

namespace dataset {

namespace {
constexpr std::array<std::string_view, 8> MISSING_TOKENS = {
    "", "na", "n/a", "nan", "null", "none", "?", "-"};
}

bool is_missing_token(std::string_view raw) {
  std::string token = Utils::to_lower_copy(Utils::trim_copy(raw));
  for (auto missing : MISSING_TOKENS)
    if (token == missing)
      return true;
  return false;
}

ParsedCell parse_cell(std::string_view raw) {
  ParsedCell cell;
  if (is_missing_token(raw))
    return cell;

  std::string token = Utils::trim_copy(raw);
  if (!token.empty() && token[0] == '+')
    token.erase(0, 1);

  auto number = Utils::string_to_number<double>(token);
  if (!number || token.empty()) {
    cell.kind = CellKind::TEXT;
    return cell;
  }

  // "inf" parses, but an infinite feature value is treated as absent
  if (!std::isfinite(*number))
    return cell;

  cell.kind = CellKind::NUMBER;
  cell.value = *number;
  return cell;
}

} // namespace dataset
