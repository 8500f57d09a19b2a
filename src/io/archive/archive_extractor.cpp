#include "io/archive/archive_extractor.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/archive/checksum_verifier.hpp"
#include "utils/utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace unpack {

namespace {

constexpr size_t READ_BLOCK_SIZE = 10240;
constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

struct ArchiveReadDeleter {
  void operator()(struct archive *a) const { archive_read_free(a); }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;

// Removes the in-progress file unless the write was committed.
class PartialFileGuard {
public:
  explicit PartialFileGuard(std::filesystem::path path)
      : path_(std::move(path)) {}
  ~PartialFileGuard() {
    if (!committed_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }
  void commit() { committed_ = true; }
  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  bool committed_ = false;
};

// A fully written member waiting for the end of the archive
struct StagedMember {
  std::string member_name;
  std::filesystem::path target;
  std::unique_ptr<PartialFileGuard> partial;
  bool unchanged = false;
};

std::filesystem::path partial_path_for(const std::filesystem::path &target) {
  return target.parent_path() /
         ("." + target.filename().string() + ".partial");
}

std::string reader_error(struct archive *a) {
  const char *message = archive_error_string(a);
  return message ? message : "unknown libarchive error";
}

bool same_content(const std::string &archive_name,
                  const std::filesystem::path &existing,
                  const std::filesystem::path &fresh) {
  try {
    return sha256_file(existing) == sha256_file(fresh);
  } catch (const std::runtime_error &e) {
    throw ExtractionError(archive_name, e.what());
  }
}

} // namespace

bool ArchiveExtractor::is_safe_member_path(const std::string &member_name) {
  if (member_name.empty())
    return false;

  std::filesystem::path member(member_name);
  if (member.is_absolute() || member.has_root_name() ||
      member_name.front() == '/' || member_name.front() == '\\')
    return false;

  for (const auto &part : member)
    if (part == "..")
      return false;
  return true;
}

std::string ArchiveExtractor::raw_output_name(const std::string &archive_name) {
  std::string out_name = archive_name;
  if (Utils::ends_with(out_name, ".xz"))
    out_name.erase(out_name.size() - 3);
  if (Utils::ends_with(out_name, ".tar"))
    out_name.erase(out_name.size() - 4);
  return out_name;
}

ExtractionResult
ArchiveExtractor::extract(const std::filesystem::path &archive_path,
                          const std::filesystem::path &dest_dir) const {
  ExtractionResult result;
  result.archive_name = archive_path.filename().string();
  const std::string &name = result.archive_name;

  std::error_code ec;
  std::filesystem::create_directories(dest_dir, ec);
  if (ec)
    throw ExtractionError(name, "could not create destination " +
                                    dest_dir.string() + ": " + ec.message());

  ArchiveReader reader(archive_read_new());
  if (!reader)
    throw ExtractionError(name, "could not allocate archive reader");

  archive_read_support_filter_all(reader.get());
  archive_read_support_format_all(reader.get());
  // Bids lowest, so it only wins when the payload is not a known container
  archive_read_support_format_raw(reader.get());

  if (archive_read_open_filename(reader.get(), archive_path.c_str(),
                                 READ_BLOCK_SIZE) != ARCHIVE_OK)
    throw ExtractionError(name, "cannot open archive: " +
                                    reader_error(reader.get()));

  LOG(LogLevel::DEBUG, LogComponent::IO_EXTRACT,
      "[" << name << "] extracting into " << dest_dir.string());

  std::vector<char> buffer(COPY_BUFFER_SIZE);
  struct archive_entry *entry = nullptr;
  std::vector<StagedMember> staged;
  int status = ARCHIVE_OK;
  while ((status = archive_read_next_header(reader.get(), &entry)) ==
             ARCHIVE_OK ||
         status == ARCHIVE_WARN) {
    if (status == ARCHIVE_WARN)
      LOG(LogLevel::WARN, LogComponent::IO_EXTRACT,
          "[" << name << "] " << reader_error(reader.get()));

    const bool is_raw = archive_format(reader.get()) == ARCHIVE_FORMAT_RAW;
    if (is_raw && archive_filter_count(reader.get()) <= 1)
      throw ExtractionError(name, "payload is neither an archive nor a "
                                  "compressed stream");
    result.payload_kind = is_raw ? "raw" : "tar";

    std::string member_name;
    if (is_raw) {
      member_name = raw_output_name(name);
    } else {
      const char *pathname = archive_entry_pathname(entry);
      member_name = pathname ? pathname : "";
    }

    if (!is_safe_member_path(member_name))
      throw ExtractionError(name, "blocked path traversal attempt: " +
                                      member_name);

    const std::filesystem::path target = dest_dir / member_name;
    const auto file_type = is_raw ? AE_IFREG : archive_entry_filetype(entry);

    if (file_type == AE_IFDIR) {
      std::filesystem::create_directories(target, ec);
      if (ec)
        throw ExtractionError(name, "could not create directory " +
                                        target.string() + ": " + ec.message());
      continue;
    }

    if (file_type != AE_IFREG) {
      LOG(LogLevel::WARN, LogComponent::IO_EXTRACT,
          "[" << name << "] skipping non-regular entry " << member_name);
      ++result.entries_skipped;
      continue;
    }

    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec)
      throw ExtractionError(name, "could not create directory " +
                                      target.parent_path().string() + ": " +
                                      ec.message());

    // A later member of the same name replaces the earlier one
    for (auto it = staged.begin(); it != staged.end(); ++it) {
      if (it->target == target) {
        staged.erase(it);
        break;
      }
    }

    StagedMember member;
    member.member_name = member_name;
    member.target = target;
    member.partial =
        std::make_unique<PartialFileGuard>(partial_path_for(target));
    {
      std::ofstream out(member.partial->path(),
                        std::ios::binary | std::ios::trunc);
      if (!out.is_open())
        throw ExtractionError(name, "could not open " +
                                        member.partial->path().string() +
                                        " for writing");

      while (true) {
        la_ssize_t got =
            archive_read_data(reader.get(), buffer.data(), buffer.size());
        if (got == 0)
          break;
        if (got < 0)
          throw ExtractionError(name, "corrupt payload in " + member_name +
                                          ": " + reader_error(reader.get()));
        out.write(buffer.data(), static_cast<std::streamsize>(got));
        if (!out)
          throw ExtractionError(name, "write failed for " +
                                          member.partial->path().string());
      }
      out.close();
      if (!out)
        throw ExtractionError(name, "could not finish writing " +
                                        member.partial->path().string());
    }
    staged.push_back(std::move(member));
  }

  if (status != ARCHIVE_EOF)
    throw ExtractionError(name, "corrupt archive: " +
                                    reader_error(reader.get()));

  // The whole archive has been read; check every target before moving any
  for (auto &member : staged) {
    if (!std::filesystem::exists(member.target, ec))
      continue;
    // Re-extraction is a no-op only when the content is identical
    if (!same_content(name, member.target, member.partial->path()))
      throw ExtractionError(name, "refusing to overwrite " +
                                      member.target.string() +
                                      " with different content");
    LOG(LogLevel::DEBUG, LogComponent::IO_EXTRACT,
        "[" << name << "] " << member.member_name << " already up to date");
    member.unchanged = true;
    ++result.files_unchanged;
  }

  std::vector<std::filesystem::path> placed;
  for (auto &member : staged) {
    result.files.push_back(member.target);
    if (member.unchanged)
      continue;

    std::filesystem::rename(member.partial->path(), member.target, ec);
    if (ec) {
      const std::string message = "could not move " +
                                  member.partial->path().string() + " to " +
                                  member.target.string() + ": " + ec.message();
      std::error_code remove_ec;
      for (const auto &path : placed)
        std::filesystem::remove(path, remove_ec);
      throw ExtractionError(name, message);
    }
    member.partial->commit();
    placed.push_back(member.target);
    ++result.files_written;
  }

  if (result.files.empty() && result.payload_kind.empty())
    result.payload_kind = "tar";

  LOG(LogLevel::INFO, LogComponent::IO_EXTRACT,
      "[" << name << "] extracted (" << result.payload_kind << ") to "
          << dest_dir.string() << ": " << result.files_written << " written, "
          << result.files_unchanged << " unchanged");
  return result;
}

} // namespace unpack
