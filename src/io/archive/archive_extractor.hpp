#ifndef ARCHIVE_EXTRACTOR_HPP
#define ARCHIVE_EXTRACTOR_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace unpack {

struct ExtractionResult {
  std::string archive_name;
  // "tar" for container archives, "raw" for a bare compressed stream
  std::string payload_kind;
  // Final paths of every regular file the archive holds, in archive order
  std::vector<std::filesystem::path> files;
  size_t files_written = 0;
  // Already present with identical content
  size_t files_unchanged = 0;
  // Links, devices and other non-regular entries
  size_t entries_skipped = 0;
};

// Unpacks tar archives (any compression libarchive reads) and bare xz
// streams. Every file is written next to its final location as a hidden
// ".partial" file; none is renamed into place until the whole archive has
// been read, so a corrupt archive leaves no files behind.
class ArchiveExtractor {
public:
  // Throws ExtractionError on corrupt payloads, unsafe member paths, or a
  // target that exists with different content.
  ExtractionResult extract(const std::filesystem::path &archive,
                           const std::filesystem::path &dest_dir) const;

  // Rejects absolute paths and ".." components.
  static bool is_safe_member_path(const std::string &member_name);

  // "benign_samples_1sec.tar.xz" -> "benign_samples_1sec"
  static std::string raw_output_name(const std::string &archive_name);
};

} // namespace unpack

#endif // ARCHIVE_EXTRACTOR_HPP
