#include "preprocessing/statistics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace preprocessing;

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();
}

TEST(StatisticsTest, MedianIgnoresMissing) {
  EXPECT_DOUBLE_EQ(median({3.0, 1.0, 2.0}), 2.0);
  EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
  EXPECT_DOUBLE_EQ(median({1.0, 2.0, NaN, 1000.0}), 2.0);
  EXPECT_TRUE(std::isnan(median({})));
  EXPECT_TRUE(std::isnan(median({NaN, NaN})));
}

TEST(StatisticsTest, QuantileInterpolatesLinearly) {
  std::vector<double> values = {1.0, 2.0, 3.0, 4.0};
  EXPECT_DOUBLE_EQ(quantile(values, 0.25), 1.75);
  EXPECT_DOUBLE_EQ(quantile(values, 0.75), 3.25);
  EXPECT_DOUBLE_EQ(quantile(values, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(quantile(values, 1.0), 4.0);
  EXPECT_DOUBLE_EQ(quantile({5.0}, 0.25), 5.0);
}

TEST(StatisticsTest, SkewnessMatchesAdjustedFisherPearson) {
  // Reference: scipy.stats.skew([1, 2, 3, 10], bias=False)
  EXPECT_NEAR(skewness({1.0, 2.0, 3.0, 10.0}), 1.7636326148, 1e-9);
  EXPECT_NEAR(skewness({1.0, 2.0, 3.0, 4.0, 5.0}), 0.0, 1e-12);
  EXPECT_LT(skewness({-10.0, 1.0, 2.0, 3.0}), 0.0);
}

TEST(StatisticsTest, SkewnessDegenerateInputsAreZero) {
  EXPECT_DOUBLE_EQ(skewness({}), 0.0);
  EXPECT_DOUBLE_EQ(skewness({1.0, 100.0}), 0.0);
  EXPECT_DOUBLE_EQ(skewness({7.0, 7.0, 7.0, 7.0}), 0.0);
}
