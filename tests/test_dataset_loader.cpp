#include "core/errors.hpp"
#include "dataset/dataset_loader.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace dataset;
using test_helpers::TempDir;

class DatasetLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::make_unique<TempDir>("loader");
    test_helpers::write_file(dir_->path() / "extracted_benign_data" /
                                 "benign_samples_1sec.csv",
                             "packets,bytes,label\n1,100,benign\n2,200,benign\n"
                             "3,300,benign\n");
    test_helpers::write_file(dir_->path() / "extracted_attack_data" /
                                 "dos_samples_1sec.csv",
                             "packets,flags,label\n900,S,attack\n950,SA,x\n");
    test_helpers::write_file(dir_->path() / "extracted_attack_data" /
                                 "recon_1sec.csv",
                             "bytes,packets\n40,1\n");
    // Other windows must not leak into window 1
    test_helpers::write_file(dir_->path() / "extracted_attack_data" /
                                 "dos_samples_2sec.csv",
                             "packets\n1\n");
  }

  DatasetLoader loader() const {
    return DatasetLoader(dir_->path(), "benign", "label");
  }

  std::unique_ptr<TempDir> dir_;
};

TEST_F(DatasetLoaderTest, RowCountIsSumOfTables) {
  MergedDataset merged = loader().load(1);

  size_t expected = 0;
  for (const auto &source : merged.sources)
    expected += source.row_count;
  EXPECT_EQ(expected, 6u);
  EXPECT_EQ(merged.row_count(), expected);
  EXPECT_EQ(merged.labels.size(), expected);
  EXPECT_EQ(merged.origins.size(), expected);
  EXPECT_EQ(merged.sources.size(), 3u);
}

TEST_F(DatasetLoaderTest, LabelsComeFromFileNames) {
  MergedDataset merged = loader().load(1);
  for (size_t i = 0; i < merged.row_count(); ++i) {
    const RowOrigin &origin = merged.origins[i];
    EXPECT_EQ(merged.labels[i], merged.sources[origin.source].class_label);
  }
  EXPECT_EQ(merged.class_labels(),
            (std::set<std::string>{"benign", "dos", "recon"}));
}

TEST_F(DatasetLoaderTest, ColumnsAreUnionInFirstSeenOrder) {
  MergedDataset merged = loader().load(1);

  // Sources are sorted by path: attack tables come before benign ones
  EXPECT_EQ(merged.columns,
            (std::vector<std::string>{"packets", "flags", "bytes"}));
  EXPECT_EQ(merged.column_index("label"), -1);

  int bytes = merged.column_index("bytes");
  int flags = merged.column_index("flags");
  for (size_t i = 0; i < merged.row_count(); ++i) {
    const auto &source = merged.sources[merged.origins[i].source];
    if (source.class_label == "dos")
      EXPECT_EQ(merged.rows[i][static_cast<size_t>(bytes)], "");
    if (source.class_label == "benign")
      EXPECT_EQ(merged.rows[i][static_cast<size_t>(flags)], "");
  }
}

TEST_F(DatasetLoaderTest, OriginsPointAtSourceRows) {
  MergedDataset merged = loader().load(1);
  int packets = merged.column_index("packets");
  for (size_t i = 0; i < merged.row_count(); ++i) {
    const RowOrigin &origin = merged.origins[i];
    if (merged.sources[origin.source].class_label == "benign")
      EXPECT_EQ(merged.rows[i][static_cast<size_t>(packets)],
                std::to_string(origin.row + 1));
  }
}

TEST_F(DatasetLoaderTest, MissingBenignOrAttackIsIncomplete) {
  try {
    loader().load(2);
    FAIL() << "expected DatasetIncompleteError";
  } catch (const DatasetIncompleteError &e) {
    EXPECT_EQ(e.time_window(), 2);
  }

  TempDir only_benign("loader_benign");
  test_helpers::write_file(only_benign / "benign_3sec.csv", "a\n1\n");
  DatasetLoader benign_loader(only_benign.path(), "benign", "label");
  EXPECT_THROW(benign_loader.load(3), DatasetIncompleteError);

  DatasetLoader empty_loader(only_benign / "nothing_here", "benign", "label");
  EXPECT_THROW(empty_loader.load(1), DatasetIncompleteError);
}

TEST_F(DatasetLoaderTest, LabelSetsMustAgreeAcrossWindows) {
  test_helpers::write_file(dir_->path() / "benign_2sec.csv", "packets\n5\n");
  MergedDataset one = loader().load(1);
  MergedDataset two = loader().load(2);

  EXPECT_NO_THROW(check_label_consistency({one, one}));
  EXPECT_THROW(check_label_consistency({one, two}), DatasetIncompleteError);
}
