#include "core/errors.hpp"
#include "io/archive/checksum_verifier.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace unpack;
using test_helpers::TempDir;

namespace {
const std::string ABC_SHA256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const std::string EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
} // namespace

TEST(Sha256FileTest, KnownDigests) {
  TempDir dir("sha");
  test_helpers::write_file(dir / "abc.bin", "abc");
  test_helpers::write_file(dir / "empty.bin", "");

  EXPECT_EQ(sha256_file(dir / "abc.bin"), ABC_SHA256);
  EXPECT_EQ(sha256_file(dir / "empty.bin"), EMPTY_SHA256);
  EXPECT_THROW(sha256_file(dir / "missing.bin"), std::runtime_error);
}

TEST(ChecksumRecordTest, AcceptsCommonFormats) {
  EXPECT_EQ(parse_checksum_record(ABC_SHA256 + "  benign_samples_1sec.tar.xz\n"),
            ABC_SHA256);
  EXPECT_EQ(parse_checksum_record(ABC_SHA256 + " *benign_samples_1sec.tar.xz"),
            ABC_SHA256);
  EXPECT_EQ(parse_checksum_record("\n\n" + ABC_SHA256 + "\n"), ABC_SHA256);

  std::string upper = ABC_SHA256;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  EXPECT_EQ(parse_checksum_record(upper), ABC_SHA256);
}

TEST(ChecksumRecordTest, RejectsMalformedRecords) {
  EXPECT_FALSE(parse_checksum_record("").has_value());
  EXPECT_FALSE(parse_checksum_record("   \n").has_value());
  EXPECT_FALSE(parse_checksum_record("deadbeef  file.tar.xz").has_value());
  EXPECT_FALSE(parse_checksum_record(ABC_SHA256 + "00").has_value());
}

TEST(VerifyChecksumTest, MatchingDigestPasses) {
  TempDir dir("verify_ok");
  test_helpers::write_file(dir / "abc.tar.xz", "abc");
  EXPECT_NO_THROW(verify_checksum(dir / "abc.tar.xz", ABC_SHA256));
}

TEST(VerifyChecksumTest, EverySingleByteMutationFails) {
  TempDir dir("verify_mutation");
  const std::string original = "timestamp,packets,bytes\n1,2,3\n4,5,6\n";
  const auto path = dir / "benign_samples_1sec.tar.xz";
  test_helpers::write_file(path, original);
  const std::string expected = sha256_file(path);

  for (size_t i = 0; i < original.size(); ++i) {
    std::string mutated = original;
    mutated[i] = static_cast<char>(mutated[i] ^ 0x01);
    test_helpers::write_file(path, mutated);
    EXPECT_THROW(verify_checksum(path, expected), IntegrityError)
        << "mutation at byte " << i << " was not detected";
  }
}

TEST(VerifyChecksumTest, MismatchCarriesBothDigests) {
  TempDir dir("verify_mismatch");
  const auto path = dir / "benign_samples_1sec.tar.xz";
  test_helpers::write_file(path, "abc");

  try {
    verify_checksum(path, EMPTY_SHA256);
    FAIL() << "expected IntegrityError";
  } catch (const IntegrityError &e) {
    EXPECT_EQ(e.archive_name(), "benign_samples_1sec.tar.xz");
    EXPECT_EQ(e.expected_digest(), EMPTY_SHA256);
    EXPECT_EQ(e.actual_digest(), ABC_SHA256);
  }
}

TEST(VerifyChecksumTest, ExpectedValueIsCaseInsensitive) {
  TempDir dir("verify_case");
  test_helpers::write_file(dir / "abc.tar.xz", "abc");
  std::string upper = ABC_SHA256;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  EXPECT_NO_THROW(verify_checksum(dir / "abc.tar.xz", upper));
}

TEST(ChecksumStoreTest, LoadsDirectoryAndManifest) {
  TempDir dir("store");
  test_helpers::write_file(dir / "checksums" / "a.tar.xz.sha256",
                           ABC_SHA256 + "  a.tar.xz\n");
  test_helpers::write_file(dir / "checksums" / "bad.tar.xz.sha256",
                           "not a hash\n");
  test_helpers::write_file(dir / "SHA256SUMS",
                           "# comment\n" + EMPTY_SHA256 +
                               " *attack_data/b.tar.xz\n");

  ChecksumStore store;
  EXPECT_EQ(store.load_directory(dir / "checksums"), 2u);
  EXPECT_EQ(store.load_manifest(dir / "SHA256SUMS"), 1u);

  EXPECT_EQ(store.lookup("a.tar.xz").status, ChecksumLookup::Status::FOUND);
  EXPECT_EQ(store.lookup("a.tar.xz").digest, ABC_SHA256);
  EXPECT_EQ(store.lookup("b.tar.xz").digest, EMPTY_SHA256);
  EXPECT_EQ(store.lookup("bad.tar.xz").status, ChecksumLookup::Status::INVALID);
  EXPECT_EQ(store.lookup("other.tar.xz").status,
            ChecksumLookup::Status::MISSING);

  EXPECT_EQ(store.load_directory(dir / "no_such_dir"), 0u);
  EXPECT_THROW(store.load_manifest(dir / "NO_MANIFEST"), IntegrityError);
}

TEST(ArchiveVerifierTest, MissingRecordPolicy) {
  TempDir dir("policy");
  const auto path = dir / "a.tar.xz";
  test_helpers::write_file(path, "abc");

  ArchiveVerifier strict(ChecksumStore{}, true);
  EXPECT_THROW(strict.verify(path), IntegrityError);

  ArchiveVerifier lenient(ChecksumStore{}, false);
  EXPECT_EQ(lenient.verify(path), VerificationOutcome::UNCHECKED);

  ChecksumStore store;
  store.add("a.tar.xz", ABC_SHA256);
  ArchiveVerifier with_record(store, false);
  EXPECT_EQ(with_record.verify(path), VerificationOutcome::VERIFIED);

  // A present but wrong record fails even when checksums are optional
  ChecksumStore wrong;
  wrong.add("a.tar.xz", EMPTY_SHA256);
  ArchiveVerifier lenient_wrong(wrong, false);
  EXPECT_THROW(lenient_wrong.verify(path), IntegrityError);
}
