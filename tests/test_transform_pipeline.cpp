#include "core/errors.hpp"
#include "preprocessing/statistics.hpp"
#include "preprocessing/transform_pipeline.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace preprocessing;
using dataset::FeatureMatrix;

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

FeatureMatrix make_matrix(std::vector<std::string> names,
                          std::vector<std::vector<double>> rows) {
  FeatureMatrix m;
  m.feature_names = std::move(names);
  m.rows = rows.size();
  for (const auto &row : rows)
    m.values.insert(m.values.end(), row.begin(), row.end());
  return m;
}

TransformPipeline make_pipeline(std::vector<std::string> numeric) {
  return TransformPipeline(dataset::FeatureSchema(std::move(numeric), {}),
                           Config::PreprocessingConfig{});
}

} // namespace

TEST(TransformPipelineTest, FourRowScenario) {
  FeatureMatrix train = make_matrix({"bytes"}, {{1.0}, {2.0}, {NaN}, {1000.0}});
  TransformPipeline pipeline = make_pipeline({"bytes"});
  pipeline.fit(train);

  ASSERT_EQ(pipeline.imputer().medians().size(), 1u);
  EXPECT_DOUBLE_EQ(pipeline.imputer().medians()[0], 2.0);
  EXPECT_TRUE(pipeline.skew_corrector().marked()[0]);
  EXPECT_GT(pipeline.skew_corrector().skewness()[0], 1.0);

  // Scaling statistics come from the four log-transformed training rows
  std::vector<double> logged = {std::log1p(1.0), std::log1p(2.0),
                                std::log1p(2.0), std::log1p(1000.0)};
  const double center = median(logged);
  const double scale = quantile(logged, 0.75) - quantile(logged, 0.25);
  EXPECT_DOUBLE_EQ(pipeline.scaler().centers()[0], center);
  EXPECT_DOUBLE_EQ(pipeline.scaler().scales()[0], scale);

  FeatureMatrix out = pipeline.apply(train);
  for (size_t r = 0; r < 4; ++r)
    EXPECT_DOUBLE_EQ(out.at(r, 0), (logged[r] - center) / scale) << r;
}

TEST(TransformPipelineTest, FittedStateIgnoresOtherSplits) {
  FeatureMatrix train =
      make_matrix({"a", "b"}, {{1.0, 5.0}, {2.0, NaN}, {3.0, 7.0}, {50.0, 8.0}});
  FeatureMatrix test =
      make_matrix({"a", "b"}, {{1e6, -3.0}, {NaN, NaN}, {-7.0, 1e9}});

  TransformPipeline alone = make_pipeline({"a", "b"});
  alone.fit(train);
  const std::string state_alone = alone.state_json().dump();

  TransformPipeline with_others = make_pipeline({"a", "b"});
  with_others.fit(train);
  FeatureMatrix transformed_test = with_others.apply(test);
  FeatureMatrix transformed_train = with_others.apply(train);
  with_others.apply_in_place(test);

  EXPECT_EQ(with_others.state_json().dump(), state_alone);
  EXPECT_EQ(transformed_test.rows, 3u);
  EXPECT_EQ(transformed_train.rows, 4u);
}

TEST(TransformPipelineTest, ZeroScaleGivesZeroNeverNaN) {
  FeatureMatrix train = make_matrix({"flag"}, {{4.0}, {4.0}, {4.0}, {4.0}});
  FeatureMatrix other = make_matrix({"flag"}, {{4.0}, {-100.0}, {NaN}, {1e12}});

  TransformPipeline pipeline = make_pipeline({"flag"});
  pipeline.fit(train);
  EXPECT_DOUBLE_EQ(pipeline.scaler().scales()[0], 0.0);

  for (const auto *m : {&train, &other}) {
    FeatureMatrix out = pipeline.apply(*m);
    for (double v : out.values) {
      EXPECT_FALSE(std::isnan(v));
      EXPECT_DOUBLE_EQ(v, 0.0);
    }
  }
}

TEST(TransformPipelineTest, LowSkewFeatureIsNotLogTransformed) {
  FeatureMatrix train =
      make_matrix({"sym"}, {{1.0}, {2.0}, {3.0}, {4.0}, {5.0}});
  TransformPipeline pipeline = make_pipeline({"sym"});
  pipeline.fit(train);

  EXPECT_FALSE(pipeline.skew_corrector().marked()[0]);
  FeatureMatrix probe = make_matrix({"sym"}, {{-4.0}, {11.0}});
  FeatureMatrix out = pipeline.apply(probe);
  // center 3, IQR 4 - 2
  EXPECT_DOUBLE_EQ(out.at(0, 0), -3.5);
  EXPECT_DOUBLE_EQ(out.at(1, 0), 4.0);
}

TEST(TransformPipelineTest, SkewedFeatureTransformedIdenticallyOnEverySplit) {
  FeatureMatrix train =
      make_matrix({"bytes"}, {{1.0}, {1.0}, {2.0}, {2.0}, {3.0}, {500.0}});
  TransformPipeline pipeline = make_pipeline({"bytes"});
  pipeline.fit(train);
  ASSERT_TRUE(pipeline.skew_corrector().marked()[0]);

  FeatureMatrix a = make_matrix({"bytes"}, {{2.0}, {-5.0}});
  FeatureMatrix b = make_matrix({"bytes"}, {{2.0}, {0.0}});
  FeatureMatrix out_a = pipeline.apply(a);
  FeatureMatrix out_b = pipeline.apply(b);

  EXPECT_DOUBLE_EQ(out_a.at(0, 0), out_b.at(0, 0));
  // Negative inputs are clamped to zero before log1p
  EXPECT_DOUBLE_EQ(out_a.at(1, 0), out_b.at(1, 0));
}

TEST(TransformPipelineTest, CenteringCanBeDisabled) {
  Config::PreprocessingConfig config;
  config.robust_centering = false;
  TransformPipeline pipeline(dataset::FeatureSchema({"x"}, {}), config);

  FeatureMatrix train = make_matrix({"x"}, {{1.0}, {2.0}, {3.0}, {4.0}, {5.0}});
  pipeline.fit(train);
  EXPECT_DOUBLE_EQ(pipeline.scaler().centers()[0], 0.0);
  EXPECT_DOUBLE_EQ(pipeline.scaler().scales()[0], 2.0);
}

TEST(TransformPipelineTest, EntirelyMissingFeatureIsEmptyColumnError) {
  FeatureMatrix train =
      make_matrix({"ok", "gone"}, {{1.0, NaN}, {2.0, NaN}, {3.0, NaN}});
  TransformPipeline pipeline = make_pipeline({"ok", "gone"});
  try {
    pipeline.fit(train);
    FAIL() << "expected EmptyColumnError";
  } catch (const EmptyColumnError &e) {
    EXPECT_EQ(e.feature(), "gone");
  }
  EXPECT_FALSE(pipeline.is_fitted());
}

TEST(TransformPipelineTest, ApplyBeforeFitOrOnOtherColumnsFails) {
  TransformPipeline pipeline = make_pipeline({"x"});
  FeatureMatrix m = make_matrix({"x"}, {{1.0}, {2.0}, {3.0}});
  EXPECT_THROW(pipeline.apply(m), PipelineError);

  pipeline.fit(m);
  FeatureMatrix wrong = make_matrix({"y"}, {{1.0}});
  EXPECT_THROW(pipeline.apply(wrong), PipelineError);
}

TEST(ColumnFilterTest, KeepsDeclaredNumericColumnsOnly) {
  dataset::MergedDataset data;
  data.time_window = 1;
  data.columns = {"proto", "bytes", "packets", "note"};
  data.rows = {{"tcp", "10", "NA", "x"}, {"udp", "inf", "3", "y"}};
  data.labels = {"benign", "dos"};
  data.origins = {{0, 0}, {1, 0}};

  ColumnFilter filter(dataset::FeatureSchema({"packets", "bytes"}, {"proto"},
                                             {"note"}));
  dataset::LabeledMatrix out = filter.apply(data);

  EXPECT_EQ(out.features.feature_names,
            (std::vector<std::string>{"packets", "bytes"}));
  ASSERT_EQ(out.rows(), 2u);
  EXPECT_TRUE(std::isnan(out.features.at(0, 0)));
  EXPECT_DOUBLE_EQ(out.features.at(0, 1), 10.0);
  EXPECT_DOUBLE_EQ(out.features.at(1, 0), 3.0);
  EXPECT_TRUE(std::isnan(out.features.at(1, 1)));
  EXPECT_EQ(out.labels, data.labels);

  data.rows[1][1] = "many";
  EXPECT_THROW(filter.apply(data), SchemaError);
}
