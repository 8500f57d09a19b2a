#ifndef DATASET_UNPACKER_HPP
#define DATASET_UNPACKER_HPP

#include "core/config.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace unpack {

struct ArchiveRecord {
  enum class Status { EXTRACTED, FAILED, NOT_ATTEMPTED };

  std::string archive_name;
  // Directory of the archive relative to the unpack root, e.g. "benign_data"
  std::string group;
  Status status = Status::NOT_ATTEMPTED;
  bool verified = false;
  size_t files = 0;
  std::string error;
};

struct UnpackReport {
  std::vector<ArchiveRecord> archives;
  // Set when a cancellation request stopped the run between archives
  bool cancelled = false;

  size_t count(ArchiveRecord::Status status) const;
};

struct UnpackOptions {
  std::filesystem::path archive_dir;
  std::filesystem::path extract_dir;
  std::string top_level_archive;
  std::filesystem::path checksum_manifest;
  bool require_checksums = true;
  bool require_top_level_checksum = false;

  static UnpackOptions from_config(const Config::DatasetConfig &config);
};

// Two-level unpacking of the published dataset: the top-level bundle is
// extracted first, then the nested per-class, per-window archives of
// "attack_data/" and "benign_data/" are verified (all of them) and extracted
// into "extracted_attack_data/" and "extracted_benign_data/".
//
// An IntegrityError anywhere aborts the run before any nested archive is
// extracted. An ExtractionError only fails the archive that raised it.
class DatasetUnpacker {
public:
  explicit DatasetUnpacker(UnpackOptions options,
                           const std::atomic<bool> *cancel_flag = nullptr);

  UnpackReport run() const;

  static constexpr const char *ARCHIVE_GROUPS[] = {"attack_data",
                                                   "benign_data"};

private:
  bool cancellation_requested() const;
  std::filesystem::path extract_top_level(UnpackReport &report) const;

  UnpackOptions options_;
  const std::atomic<bool> *cancel_flag_;
};

} // namespace unpack

#endif // DATASET_UNPACKER_HPP
