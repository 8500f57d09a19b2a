#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);

// Splits on `delimiter`, trims every token and drops the empty ones
std::vector<std::string> split_and_trim(const std::string &text,
                                        char delimiter);

std::string to_lower_copy(std::string_view sv);
bool ends_with(std::string_view text, std::string_view suffix);
bool starts_with(std::string_view text, std::string_view prefix);

// Creates the parent directory of `file_path` if it does not exist yet.
// Returns false if the directory could not be created.
bool create_directory_for_file(const std::string &file_path);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
