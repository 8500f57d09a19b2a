#include "dataset/sample_file.hpp"
#include "utils/utils.hpp"

#include <regex>

namespace dataset {

std::optional<SampleFileInfo> parse_sample_file_name(const std::string &name) {
  static const std::regex pattern(R"(^(.+?)(?:_samples)?_([0-9]+)sec\.csv$)",
                                  std::regex::icase);
  std::smatch match;
  if (!std::regex_match(name, match, pattern))
    return std::nullopt;

  auto window = Utils::string_to_number<int>(match[2].str());
  if (!window || *window <= 0)
    return std::nullopt;

  SampleFileInfo info;
  info.class_label = Utils::to_lower_copy(match[1].str());
  info.time_window = *window;
  return info;
}

} // namespace dataset
