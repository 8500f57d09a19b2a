#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <filesystem>

// --- Tests for split_string / split_and_trim ---
TEST(UtilsTest, SplitString) {
  EXPECT_EQ(Utils::split_string("a,b,,c", ','),
            (std::vector<std::string>{"a", "b", "", "c"}));
  EXPECT_TRUE(Utils::split_string("", ',').empty());
  EXPECT_EQ(Utils::split_and_trim(" packets ,  , bytes,", ','),
            (std::vector<std::string>{"packets", "bytes"}));
  EXPECT_TRUE(Utils::split_and_trim("  ", ',').empty());
}

// --- Tests for case and affix helpers ---
TEST(UtilsTest, CaseAndAffixes) {
  EXPECT_EQ(Utils::to_lower_copy("DoS_Samples"), "dos_samples");
  EXPECT_TRUE(Utils::ends_with("recon.tar.xz", ".tar.xz"));
  EXPECT_FALSE(Utils::ends_with("xz", ".tar.xz"));
  EXPECT_TRUE(Utils::starts_with("extracted_benign_data", "extracted_"));
  EXPECT_FALSE(Utils::starts_with("benign", "benign_data"));
}

// --- Tests for trim helpers ---
TEST(UtilsTest, Trim) {
  EXPECT_EQ(Utils::trim_copy("  \tvalue \r\n"), "value");
  EXPECT_EQ(Utils::trim_copy("   "), "");
  std::string s = "  inner space  ";
  Utils::trim_inplace(s);
  EXPECT_EQ(s, "inner space");
}

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(*Utils::string_to_number<int>("42"), 42);
  EXPECT_EQ(*Utils::string_to_number<int>("-7"), -7);
  EXPECT_FALSE(Utils::string_to_number<int>("4x").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("abc").has_value());
  EXPECT_DOUBLE_EQ(*Utils::string_to_number<double>("0.25"), 0.25);
  // Empty and "-" read as zero
  EXPECT_EQ(*Utils::string_to_number<int>(""), 0);
  EXPECT_DOUBLE_EQ(*Utils::string_to_number<double>("-"), 0.0);
}

TEST(UtilsTest, CreateDirectoryForFile) {
  auto root = std::filesystem::temp_directory_path() / "ics_utils_test";
  std::filesystem::remove_all(root);

  auto file = root / "nested" / "dir" / "out.json";
  EXPECT_TRUE(Utils::create_directory_for_file(file.string()));
  EXPECT_TRUE(std::filesystem::is_directory(file.parent_path()));
  EXPECT_TRUE(Utils::create_directory_for_file("bare_name.txt"));

  std::filesystem::remove_all(root);
}
