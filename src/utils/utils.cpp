#include "utils/utils.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string> split_and_trim(const std::string &text,
                                        char delimiter) {
  std::vector<std::string> tokens;
  for (const auto &token : split_string(text, delimiter)) {
    std::string trimmed = trim_copy(token);
    if (!trimmed.empty())
      tokens.push_back(std::move(trimmed));
  }
  return tokens;
}

std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() &&
         text.compare(0, prefix.size(), prefix) == 0;
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}
} // namespace Utils
