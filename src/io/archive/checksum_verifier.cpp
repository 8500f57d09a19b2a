#include "io/archive/checksum_verifier.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace unpack {

namespace {

constexpr size_t READ_BLOCK_SIZE = 1024 * 1024;
constexpr size_t SHA256_HEX_LENGTH = 64;
constexpr const char *RECORD_SUFFIX = ".sha256";

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string to_hex(const unsigned char *bytes, unsigned int length) {
  static const char *digits = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(digits[bytes[i] >> 4]);
    hex.push_back(digits[bytes[i] & 0x0f]);
  }
  return hex;
}

std::string normalize_digest(const std::string &token) {
  std::string digest;
  for (unsigned char c : token)
    if (std::isxdigit(c))
      digest.push_back(static_cast<char>(std::tolower(c)));
  return digest;
}

} // namespace

std::string sha256_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throw std::runtime_error("Could not open file for hashing: " +
                             path.string());

  std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("Could not initialize SHA-256 context");

  std::vector<char> buffer(READ_BLOCK_SIZE);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = in.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(),
                         static_cast<size_t>(got)) != 1)
      throw std::runtime_error("SHA-256 update failed for " + path.string());
  }
  if (in.bad())
    throw std::runtime_error("Read error while hashing " + path.string());

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1)
    throw std::runtime_error("SHA-256 finalization failed for " +
                             path.string());

  return to_hex(digest.data(), digest_length);
}

std::optional<std::string> parse_checksum_record(const std::string &text) {
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    std::string trimmed = Utils::trim_copy(line);
    if (trimmed.empty())
      continue;

    std::istringstream tokens(trimmed);
    std::string first_token;
    tokens >> first_token;
    std::string digest = normalize_digest(first_token);
    if (digest.size() != SHA256_HEX_LENGTH)
      return std::nullopt;
    return digest;
  }
  return std::nullopt;
}

void verify_checksum(const std::filesystem::path &archive,
                     const std::string &expected) {
  const std::string archive_name = archive.filename().string();
  std::string expected_digest = normalize_digest(expected);
  if (expected_digest.size() != SHA256_HEX_LENGTH)
    throw IntegrityError(archive_name, expected, "",
                         "expected checksum is not a SHA-256 hex digest");

  std::string actual;
  try {
    actual = sha256_file(archive);
  } catch (const std::runtime_error &e) {
    throw IntegrityError(archive_name, expected_digest, "", e.what());
  }

  if (actual != expected_digest) {
    LOG(LogLevel::ERROR, LogComponent::IO_VERIFY,
        "[" << archive_name << "] checksum FAILED (expected "
            << expected_digest << ", got " << actual << ")");
    throw IntegrityError(archive_name, expected_digest, actual,
                         "checksum mismatch (expected " + expected_digest +
                             ", got " + actual + ")");
  }

  LOG(LogLevel::INFO, LogComponent::IO_VERIFY,
      "[" << archive_name << "] checksum passed");
}

void ChecksumStore::add(const std::string &archive_name,
                        const std::string &digest, const std::string &source) {
  ChecksumLookup record;
  record.source = source;
  std::string normalized = normalize_digest(digest);
  if (normalized.size() == SHA256_HEX_LENGTH) {
    record.status = ChecksumLookup::Status::FOUND;
    record.digest = normalized;
  } else {
    record.status = ChecksumLookup::Status::INVALID;
  }
  records_[archive_name] = record;
}

bool ChecksumStore::load_record_file(const std::filesystem::path &record_file,
                                     const std::string &archive_name) {
  std::ifstream in(record_file);
  if (!in.is_open())
    return false;

  std::stringstream contents;
  contents << in.rdbuf();

  ChecksumLookup record;
  record.source = record_file.string();
  if (auto digest = parse_checksum_record(contents.str())) {
    record.status = ChecksumLookup::Status::FOUND;
    record.digest = *digest;
  } else {
    record.status = ChecksumLookup::Status::INVALID;
    LOG(LogLevel::WARN, LogComponent::IO_VERIFY,
        "Invalid checksum file format: " << record_file.filename().string());
  }
  records_[archive_name] = record;
  return true;
}

size_t ChecksumStore::load_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec))
    return 0;

  size_t loaded = 0;
  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    std::string file_name = entry.path().filename().string();
    if (!Utils::ends_with(file_name, RECORD_SUFFIX))
      continue;

    std::string archive_name =
        file_name.substr(0, file_name.size() - std::string(RECORD_SUFFIX).size());
    if (load_record_file(entry.path(), archive_name))
      ++loaded;
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_VERIFY,
      "Loaded " << loaded << " checksum records from " << dir.string());
  return loaded;
}

size_t ChecksumStore::load_manifest(const std::filesystem::path &manifest) {
  std::ifstream in(manifest);
  if (!in.is_open())
    throw IntegrityError(manifest.filename().string(), "", "",
                         "could not open checksum manifest " +
                             manifest.string());

  size_t loaded = 0;
  std::string line;
  int line_num = 0;
  while (std::getline(in, line)) {
    ++line_num;
    std::string trimmed = Utils::trim_copy(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue;

    std::istringstream tokens(trimmed);
    std::string digest_token;
    std::string name_token;
    tokens >> digest_token >> name_token;
    if (name_token.empty()) {
      LOG(LogLevel::WARN, LogComponent::IO_VERIFY,
          "Manifest " << manifest.filename().string() << " line " << line_num
                      << " has no archive name, skipping");
      continue;
    }
    // sha256sum marks binary mode with a leading '*'
    if (name_token[0] == '*')
      name_token.erase(0, 1);
    name_token = std::filesystem::path(name_token).filename().string();

    add(name_token, digest_token, manifest.string());
    ++loaded;
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_VERIFY,
      "Loaded " << loaded << " checksum records from manifest "
                << manifest.string());
  return loaded;
}

ChecksumLookup ChecksumStore::lookup(const std::string &archive_name) const {
  auto it = records_.find(archive_name);
  if (it == records_.end())
    return {};
  return it->second;
}

ArchiveVerifier::ArchiveVerifier(ChecksumStore store, bool require_checksums)
    : store_(std::move(store)), require_checksums_(require_checksums) {}

VerificationOutcome
ArchiveVerifier::verify(const std::filesystem::path &archive) const {
  const std::string archive_name = archive.filename().string();
  ChecksumLookup record = store_.lookup(archive_name);

  switch (record.status) {
  case ChecksumLookup::Status::FOUND:
    verify_checksum(archive, record.digest);
    return VerificationOutcome::VERIFIED;

  case ChecksumLookup::Status::INVALID:
    if (require_checksums_)
      throw IntegrityError(archive_name, "", "",
                           "invalid checksum record in " + record.source);
    LOG(LogLevel::WARN, LogComponent::IO_VERIFY,
        "[" << archive_name << "] invalid checksum record in "
            << record.source << ", extracting unverified");
    return VerificationOutcome::UNCHECKED;

  case ChecksumLookup::Status::MISSING:
    break;
  }

  if (require_checksums_)
    throw IntegrityError(archive_name, "", "", "no checksum record found");

  LOG(LogLevel::WARN, LogComponent::IO_VERIFY,
      "[" << archive_name << "] no checksum record, extracting unverified");
  return VerificationOutcome::UNCHECKED;
}

} // namespace unpack
