#include "io/archive/dataset_unpacker.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "io/archive/archive_extractor.hpp"
#include "io/archive/checksum_verifier.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace unpack {

namespace {

constexpr const char *CHECKSUM_DIR_NAME = "checksums";
constexpr const char *ARCHIVE_SUFFIX = ".tar.xz";

struct PendingArchive {
  std::filesystem::path path;
  std::filesystem::path dest_dir;
  std::string group;
  VerificationOutcome outcome = VerificationOutcome::UNCHECKED;
};

std::vector<std::filesystem::path>
list_archives(const std::filesystem::path &dir) {
  std::vector<std::filesystem::path> archives;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec))
    return archives;

  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    if (entry.is_regular_file() &&
        Utils::ends_with(entry.path().filename().string(), ARCHIVE_SUFFIX))
      archives.push_back(entry.path());
  }
  std::sort(archives.begin(), archives.end());
  return archives;
}

LabeledCounter &archive_counter() {
  static LabeledCounter *counter =
      MetricsManager::instance().register_labeled_counter(
          "ics_archives_processed_total",
          "Archives handled by the unpacker, by outcome.");
  return *counter;
}

} // namespace

size_t UnpackReport::count(ArchiveRecord::Status status) const {
  return static_cast<size_t>(
      std::count_if(archives.begin(), archives.end(),
                    [status](const ArchiveRecord &r) {
                      return r.status == status;
                    }));
}

UnpackOptions UnpackOptions::from_config(const Config::DatasetConfig &config) {
  UnpackOptions options;
  options.archive_dir = config.archive_dir;
  options.extract_dir = config.extract_dir;
  options.top_level_archive = config.top_level_archive;
  options.checksum_manifest = config.checksum_manifest;
  options.require_checksums = config.require_checksums;
  options.require_top_level_checksum = config.require_top_level_checksum;
  return options;
}

DatasetUnpacker::DatasetUnpacker(UnpackOptions options,
                                 const std::atomic<bool> *cancel_flag)
    : options_(std::move(options)), cancel_flag_(cancel_flag) {}

bool DatasetUnpacker::cancellation_requested() const {
  return cancel_flag_ != nullptr && cancel_flag_->load();
}

std::filesystem::path
DatasetUnpacker::extract_top_level(UnpackReport &report) const {
  const std::filesystem::path bundle =
      options_.archive_dir / options_.top_level_archive;

  std::error_code ec;
  if (options_.top_level_archive.empty() ||
      !std::filesystem::is_regular_file(bundle, ec)) {
    bool has_groups = false;
    for (const char *group : ARCHIVE_GROUPS)
      has_groups = has_groups ||
                   std::filesystem::is_directory(options_.archive_dir / group);
    if (!has_groups)
      throw ExtractionError(options_.top_level_archive,
                            "top-level archive not found in " +
                                options_.archive_dir.string());

    LOG(LogLevel::INFO, LogComponent::IO_EXTRACT,
        "No top-level bundle, using archive groups under "
            << options_.archive_dir.string());
    return options_.archive_dir;
  }

  ChecksumStore store;
  store.load_directory(options_.archive_dir / CHECKSUM_DIR_NAME);
  store.load_record_file(
      options_.archive_dir / (options_.top_level_archive + ".sha256"),
      options_.top_level_archive);
  if (!options_.checksum_manifest.empty())
    store.load_manifest(options_.checksum_manifest);

  ArchiveVerifier verifier(std::move(store),
                           options_.require_top_level_checksum);

  ArchiveRecord record;
  record.archive_name = options_.top_level_archive;
  record.group = ".";
  record.verified = verifier.verify(bundle) == VerificationOutcome::VERIFIED;

  ArchiveExtractor extractor;
  ExtractionResult result = extractor.extract(bundle, options_.extract_dir);
  record.status = ArchiveRecord::Status::EXTRACTED;
  record.files = result.files.size();
  report.archives.push_back(record);
  archive_counter().increment({{"outcome", "extracted"}});

  return options_.extract_dir;
}

UnpackReport DatasetUnpacker::run() const {
  UnpackReport report;

  std::error_code ec;
  std::filesystem::create_directories(options_.extract_dir, ec);
  if (ec)
    throw ExtractionError(options_.top_level_archive,
                          "could not create " + options_.extract_dir.string() +
                              ": " + ec.message());

  const std::filesystem::path root = extract_top_level(report);

  // Collect and verify every nested archive before extracting any of them
  std::vector<PendingArchive> pending;
  for (const char *group : ARCHIVE_GROUPS) {
    const std::filesystem::path group_dir = root / group;
    std::vector<std::filesystem::path> archives = list_archives(group_dir);
    if (archives.empty()) {
      LOG(LogLevel::WARN, LogComponent::IO_EXTRACT,
          "No .tar.xz files found in " << group_dir.string());
      continue;
    }

    const std::filesystem::path checksum_dir = group_dir / CHECKSUM_DIR_NAME;
    ChecksumStore store;
    store.load_directory(checksum_dir);
    if (!options_.checksum_manifest.empty())
      store.load_manifest(options_.checksum_manifest);
    if (store.empty())
      LOG(LogLevel::WARN, LogComponent::IO_VERIFY,
          "No checksum records for " << group_dir.string());

    ArchiveVerifier verifier(std::move(store), options_.require_checksums);
    for (const auto &archive : archives) {
      if (cancellation_requested()) {
        report.cancelled = true;
        LOG(LogLevel::WARN, LogComponent::IO_VERIFY,
            "Cancellation requested, stopping verification");
        return report;
      }

      PendingArchive item;
      item.path = archive;
      item.group = group;
      item.dest_dir = options_.extract_dir / (std::string("extracted_") + group);
      try {
        item.outcome = verifier.verify(archive);
      } catch (const IntegrityError &) {
        archive_counter().increment({{"outcome", "integrity_error"}});
        throw;
      }
      pending.push_back(std::move(item));
    }
  }

  ArchiveExtractor extractor;
  std::string current_group;
  size_t group_total = 0;
  size_t group_ok = 0;
  auto close_group = [&]() {
    if (!current_group.empty())
      LOG(LogLevel::INFO, LogComponent::IO_EXTRACT,
          "Done processing " << current_group << ". Extracted " << group_ok
                             << "/" << group_total << " archives.");
  };

  for (const auto &item : pending) {
    if (item.group != current_group) {
      close_group();
      current_group = item.group;
      group_total = 0;
      group_ok = 0;
    }
    ++group_total;

    ArchiveRecord record;
    record.archive_name = item.path.filename().string();
    record.group = item.group;
    record.verified = item.outcome == VerificationOutcome::VERIFIED;

    if (cancellation_requested()) {
      report.cancelled = true;
      report.archives.push_back(record);
      continue;
    }

    try {
      ExtractionResult result = extractor.extract(item.path, item.dest_dir);
      record.status = ArchiveRecord::Status::EXTRACTED;
      record.files = result.files.size();
      ++group_ok;
      archive_counter().increment({{"outcome", "extracted"}});
    } catch (const ExtractionError &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_EXTRACT,
          "Extract error: " << e.what() << " -> SKIP");
      record.status = ArchiveRecord::Status::FAILED;
      record.error = e.what();
      archive_counter().increment({{"outcome", "extraction_error"}});
    }
    report.archives.push_back(record);
  }
  close_group();

  if (report.cancelled)
    LOG(LogLevel::WARN, LogComponent::IO_EXTRACT,
        "Unpacking cancelled; "
            << report.count(ArchiveRecord::Status::NOT_ATTEMPTED)
            << " archives not attempted");
  return report;
}

} // namespace unpack
