#include "core/errors.hpp"
#include "dataset/cell_value.hpp"
#include "dataset/csv_reader.hpp"
#include "dataset/sample_file.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace dataset;
using test_helpers::TempDir;

TEST(CsvReaderTest, SplitsQuotedFields) {
  auto fields = split_csv_record(R"(a,"b,c","say ""hi""",,e)");
  ASSERT_EQ(fields.size(), 5u);
  EXPECT_EQ(fields[0], "a");
  EXPECT_EQ(fields[1], "b,c");
  EXPECT_EQ(fields[2], "say \"hi\"");
  EXPECT_EQ(fields[3], "");
  EXPECT_EQ(fields[4], "e");
}

TEST(CsvReaderTest, ReadsHeaderRowsAndCrlf) {
  TempDir dir("csv");
  test_helpers::write_file(dir / "t.csv",
                           "\xEF\xBB\xBFpackets, bytes ,proto\r\n"
                           "1,2,tcp\r\n"
                           "\r\n"
                           "3,\"4\",\"multi\nline\"\r\n"
                           "5\r\n");

  RawTable table = read_csv(dir / "t.csv");
  ASSERT_EQ(table.header.size(), 3u);
  EXPECT_EQ(table.header[0], "packets");
  EXPECT_EQ(table.header[1], "bytes");
  ASSERT_EQ(table.rows.size(), 3u);
  EXPECT_EQ(table.rows[1][2], "multi\nline");
  // Short rows are padded with missing cells
  EXPECT_EQ(table.rows[2].size(), 3u);
  EXPECT_EQ(table.rows[2][1], "");
}

TEST(CsvReaderTest, RejectsBrokenTables) {
  TempDir dir("csv_bad");
  test_helpers::write_file(dir / "wide.csv", "a,b\n1,2,3\n");
  test_helpers::write_file(dir / "dup.csv", "a,a\n1,2\n");
  test_helpers::write_file(dir / "empty.csv", "");

  EXPECT_THROW(read_csv(dir / "wide.csv"), PipelineError);
  EXPECT_THROW(read_csv(dir / "dup.csv"), SchemaError);
  EXPECT_THROW(read_csv(dir / "empty.csv"), PipelineError);
  EXPECT_THROW(read_csv(dir / "missing.csv"), PipelineError);
}

TEST(CellValueTest, MissingTokensAndNonFiniteValues) {
  for (const char *token : {"", "  ", "NA", "NaN", "nan", "null", "NULL", "-"})
    EXPECT_EQ(parse_cell(token).kind, CellKind::MISSING) << "'" << token << "'";

  EXPECT_EQ(parse_cell("inf").kind, CellKind::MISSING);
  EXPECT_EQ(parse_cell("-inf").kind, CellKind::MISSING);
}

TEST(CellValueTest, NumbersAndText) {
  ParsedCell number = parse_cell(" 1.5e3 ");
  EXPECT_EQ(number.kind, CellKind::NUMBER);
  EXPECT_DOUBLE_EQ(number.value, 1500.0);

  EXPECT_DOUBLE_EQ(parse_cell("+7").value, 7.0);
  EXPECT_DOUBLE_EQ(parse_cell("-0.25").value, -0.25);
  EXPECT_EQ(parse_cell("tcp").kind, CellKind::TEXT);
  EXPECT_EQ(parse_cell("12abc").kind, CellKind::TEXT);
}

TEST(SampleFileTest, ParsesClassAndWindow) {
  auto plain = parse_sample_file_name(std::string("benign_1sec.csv"));
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->class_label, "benign");
  EXPECT_EQ(plain->time_window, 1);

  auto samples = parse_sample_file_name(std::string("dos_flood_samples_10sec.csv"));
  ASSERT_TRUE(samples.has_value());
  EXPECT_EQ(samples->class_label, "dos_flood");
  EXPECT_EQ(samples->time_window, 10);

  auto from_path = parse_sample_file_name(
      std::filesystem::path("/data/extracted_attack_data/Recon_5sec.csv"));
  ASSERT_TRUE(from_path.has_value());
  EXPECT_EQ(from_path->class_label, "recon");

  EXPECT_FALSE(parse_sample_file_name(std::string("benign_1sec.tar.xz")));
  EXPECT_FALSE(parse_sample_file_name(std::string("benign.csv")));
  EXPECT_FALSE(parse_sample_file_name(std::string("benign_0sec.csv")));
}
