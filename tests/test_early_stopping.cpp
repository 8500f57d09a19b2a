#include "training/early_stopping.hpp"
#include "training/label_encoder.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

using training::EarlyStoppingMonitor;

TEST(EarlyStoppingTest, StopsAfterPatienceStaleRounds) {
  EarlyStoppingMonitor monitor(3, 0.0);
  EXPECT_FALSE(monitor.update(1, 1.0));
  EXPECT_FALSE(monitor.update(2, 0.8));
  EXPECT_FALSE(monitor.update(3, 0.9));
  EXPECT_FALSE(monitor.update(4, 0.85));
  EXPECT_TRUE(monitor.update(5, 0.8));
  EXPECT_EQ(monitor.best_round(), 2);
  EXPECT_DOUBLE_EQ(monitor.best_value(), 0.8);
}

TEST(EarlyStoppingTest, ImprovementMustExceedMinDelta) {
  EarlyStoppingMonitor monitor(2, 0.1);
  monitor.update(1, 1.0);
  EXPECT_FALSE(monitor.update(2, 0.95));
  EXPECT_EQ(monitor.best_round(), 1);
  EXPECT_FALSE(monitor.update(3, 0.85));
  EXPECT_EQ(monitor.best_round(), 3);
  EXPECT_EQ(monitor.rounds_without_improvement(), 0);
}

TEST(EarlyStoppingTest, ZeroPatienceNeverStops) {
  EarlyStoppingMonitor monitor(0, 0.0);
  monitor.update(1, 0.5);
  for (int round = 2; round < 100; ++round)
    EXPECT_FALSE(monitor.update(round, 1.0));
  EXPECT_EQ(monitor.best_round(), 1);
}

TEST(LabelEncoderTest, SortedContiguousIds) {
  training::LabelEncoder encoder(
      std::vector<std::string>{"recon", "benign", "dos", "benign"});
  EXPECT_EQ(encoder.classes(),
            (std::vector<std::string>{"benign", "dos", "recon"}));
  EXPECT_EQ(encoder.encode("benign"), 0);
  EXPECT_EQ(encoder.encode("recon"), 2);
  EXPECT_EQ(encoder.decode(1), "dos");
  EXPECT_THROW(encoder.encode("mitm"), PipelineError);
  EXPECT_THROW(encoder.decode(3), PipelineError);
}
