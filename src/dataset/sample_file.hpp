#ifndef SAMPLE_FILE_HPP
#define SAMPLE_FILE_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace dataset {

// Identity of one extracted sample table, taken from its file name:
// "<class>_<N>sec.csv" or "<class>_samples_<N>sec.csv".
struct SampleFileInfo {
  std::string class_label;
  int time_window = 0;
};

std::optional<SampleFileInfo> parse_sample_file_name(const std::string &name);

inline std::optional<SampleFileInfo>
parse_sample_file_name(const std::filesystem::path &path) {
  return parse_sample_file_name(path.filename().string());
}

} // namespace dataset

#endif // SAMPLE_FILE_HPP
