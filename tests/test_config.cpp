#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include "../src/core/config.hpp"
#include "../src/core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "ics_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config::AppConfig config;
    std::vector<std::string> errors;
    EXPECT_TRUE(Config::validate_app_config(config, errors));
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(config.resolved_data_dir(), "data/extracted");

    config.dataset.data_dir = "/srv/ics";
    EXPECT_EQ(config.resolved_data_dir(), "/srv/ics");
}

TEST_F(ConfigTest, DatasetAndSplitParsing) {
    std::string config_content = R"(
[Dataset]
unpack = no
archive_dir = /data/in
extract_dir = /data/out
time_window = 5
benign_class = normal
label_column = Class
checksum_manifest = /data/in/SHA256SUMS

[Split]
test_fraction = 0.25
validation_fraction = 0.15
seed = 7
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_FALSE(config->dataset.unpack);
    EXPECT_EQ(config->dataset.archive_dir, "/data/in");
    EXPECT_EQ(config->dataset.extract_dir, "/data/out");
    EXPECT_EQ(config->dataset.time_window, 5);
    EXPECT_EQ(config->dataset.benign_class, "normal");
    EXPECT_EQ(config->dataset.label_column, "Class");
    EXPECT_EQ(config->dataset.checksum_manifest, "/data/in/SHA256SUMS");
    EXPECT_TRUE(config->dataset.require_checksums);
    EXPECT_DOUBLE_EQ(config->split.test_fraction, 0.25);
    EXPECT_DOUBLE_EQ(config->split.validation_fraction, 0.15);
    EXPECT_EQ(config->split.seed, 7u);
}

TEST_F(ConfigTest, SchemaListsAreTrimmed) {
    std::string config_content = R"(
[Schema]
numeric_columns = packets , bytes,, duration
categorical_columns = protocol
excluded_columns =
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->schema.numeric_columns,
              (std::vector<std::string>{"packets", "bytes", "duration"}));
    EXPECT_EQ(config->schema.categorical_columns,
              (std::vector<std::string>{"protocol"}));
    EXPECT_TRUE(config->schema.excluded_columns.empty());
}

TEST_F(ConfigTest, TrainingAndOutputParsing) {
    std::string config_content = R"(
[Preprocessing]
skew_threshold = 0.5
robust_centering = off
quantile_low = 10
quantile_high = 90

[Training]
learning_rate = 0.1
num_leaves = 15
max_rounds = 200
early_stopping_rounds = 10
monitor_metric = MULTI_ERROR
num_threads = 2

[Output]
output_dir = /tmp/run
importance_type = Split
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_DOUBLE_EQ(config->preprocessing.skew_threshold, 0.5);
    EXPECT_FALSE(config->preprocessing.robust_centering);
    EXPECT_DOUBLE_EQ(config->preprocessing.quantile_low, 10.0);
    EXPECT_DOUBLE_EQ(config->preprocessing.quantile_high, 90.0);
    EXPECT_DOUBLE_EQ(config->training.learning_rate, 0.1);
    EXPECT_EQ(config->training.num_leaves, 15);
    EXPECT_EQ(config->training.max_rounds, 200);
    EXPECT_EQ(config->training.early_stopping_rounds, 10);
    EXPECT_EQ(config->training.monitor_metric, "multi_error");
    EXPECT_EQ(config->training.num_threads, 2);
    EXPECT_EQ(config->output.output_dir, "/tmp/run");
    EXPECT_EQ(config->output.importance_type, "split");
    EXPECT_EQ(config->output.model_file, "model.txt");
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
    std::string config_content = R"(
[Training]
learning_rate = fast
max_rounds = 12abc
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_DOUBLE_EQ(config->training.learning_rate, 0.05);
    EXPECT_EQ(config->training.max_rounds, 1000);
}

TEST_F(ConfigTest, ValidationFailureKeepsPreviousConfig) {
    std::string config_content = R"(
[Dataset]
time_window = 11

[Split]
test_fraction = 0.6
validation_fraction = 0.4
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));
    EXPECT_EQ(manager.get_config()->dataset.time_window, 1);

    Config::AppConfig config;
    ASSERT_TRUE(Config::parse_config_into(config_file, config));
    std::vector<std::string> errors;
    EXPECT_FALSE(Config::validate_app_config(config, errors));
    EXPECT_EQ(errors.size(), 2u);
}

TEST_F(ConfigTest, CrossSectionValidation) {
    Config::AppConfig config;
    config.schema.numeric_columns = {"bytes", "label"};
    config.schema.categorical_columns = {"bytes"};
    config.training.monitor_metric = "auc";
    config.output.importance_type = "weight";

    std::vector<std::string> errors;
    EXPECT_FALSE(Config::validate_app_config(config, errors));
    EXPECT_EQ(errors.size(), 4u);
}

TEST_F(ConfigTest, MissingFileReturnsFalse) {
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
    EXPECT_EQ(manager.get_config()->training.max_rounds, 1000);
}

TEST_F(ConfigTest, LoggingLevelsAndWildcards) {
    std::string config_content = R"(
[Logging]
default_level = ERROR
io.* = DEBUG
train = trace
unknown.component = INFO
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    const auto &levels = manager.get_config()->logging.log_levels;
    EXPECT_EQ(levels.at(LogComponent::IO_VERIFY), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::IO_EXTRACT), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::TRAIN), LogLevel::TRACE);
    EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::ERROR);
    EXPECT_EQ(levels.at(LogComponent::DATA_LOADER), LogLevel::ERROR);
}

TEST_F(ConfigTest, StringHelpers) {
    EXPECT_TRUE(Config::string_to_bool(" Yes "));
    EXPECT_TRUE(Config::string_to_bool("ON"));
    EXPECT_FALSE(Config::string_to_bool("maybe"));
    EXPECT_EQ(Config::string_to_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(Config::string_to_log_level("bogus"), LogLevel::INFO);
}
