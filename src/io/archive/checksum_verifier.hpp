#ifndef CHECKSUM_VERIFIER_HPP
#define CHECKSUM_VERIFIER_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace unpack {

// Lowercase hex SHA-256 of the file's bytes, streamed in 1 MiB blocks.
// Throws std::runtime_error if the file cannot be read.
std::string sha256_file(const std::filesystem::path &path);

// Extracts the digest from the first line of a checksum record. Accepts
// "<hash>  name", "<hash> *name" and a bare "<hash>". Non-hex characters in
// the first token are ignored; anything but 64 hex digits is rejected.
std::optional<std::string> parse_checksum_record(const std::string &text);

// Throws IntegrityError unless the archive's digest equals `expected`.
void verify_checksum(const std::filesystem::path &archive,
                     const std::string &expected);

struct ChecksumLookup {
  enum class Status { FOUND, MISSING, INVALID };
  Status status = Status::MISSING;
  std::string digest;
  // Where the record came from, for diagnostics
  std::string source;
};

// Expected digests keyed by archive file name. Populated from per-archive
// "<name>.sha256" files and/or sha256sum-style manifests.
class ChecksumStore {
public:
  void add(const std::string &archive_name, const std::string &digest,
           const std::string &source = "manual");

  // Loads every "<archive>.sha256" file of `dir`. Returns the number of
  // records read; a missing directory yields 0.
  size_t load_directory(const std::filesystem::path &dir);

  // Loads a manifest with one "<hash>  <name>" line per archive. Throws
  // IntegrityError if the manifest cannot be opened.
  size_t load_manifest(const std::filesystem::path &manifest);

  // Reads a single "<archive>.sha256" file if present.
  bool load_record_file(const std::filesystem::path &record_file,
                        const std::string &archive_name);

  ChecksumLookup lookup(const std::string &archive_name) const;
  bool empty() const { return records_.empty(); }
  size_t size() const { return records_.size(); }

private:
  std::map<std::string, ChecksumLookup> records_;
};

enum class VerificationOutcome { VERIFIED, UNCHECKED };

// Applies the checksum policy to one archive: a found record must match, a
// missing or malformed record is fatal when checksums are required and only
// warned about otherwise.
class ArchiveVerifier {
public:
  ArchiveVerifier(ChecksumStore store, bool require_checksums);

  VerificationOutcome verify(const std::filesystem::path &archive) const;

private:
  ChecksumStore store_;
  bool require_checksums_;
};

} // namespace unpack

#endif // CHECKSUM_VERIFIER_HPP
