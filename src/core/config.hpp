#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Dataset Settings
constexpr const char *DS_UNPACK = "unpack";
constexpr const char *DS_ARCHIVE_DIR = "archive_dir";
constexpr const char *DS_EXTRACT_DIR = "extract_dir";
constexpr const char *DS_DATA_DIR = "data_dir";
constexpr const char *DS_TOP_LEVEL_ARCHIVE = "top_level_archive";
constexpr const char *DS_CHECKSUM_MANIFEST = "checksum_manifest";
constexpr const char *DS_REQUIRE_CHECKSUMS = "require_checksums";
constexpr const char *DS_REQUIRE_TOP_LEVEL_CHECKSUM =
    "require_top_level_checksum";
constexpr const char *DS_TIME_WINDOW = "time_window";
constexpr const char *DS_BENIGN_CLASS = "benign_class";
constexpr const char *DS_LABEL_COLUMN = "label_column";

// Split Settings
constexpr const char *SP_TEST_FRACTION = "test_fraction";
constexpr const char *SP_VALIDATION_FRACTION = "validation_fraction";
constexpr const char *SP_SEED = "seed";

// Schema Settings
constexpr const char *SC_NUMERIC_COLUMNS = "numeric_columns";
constexpr const char *SC_CATEGORICAL_COLUMNS = "categorical_columns";
constexpr const char *SC_EXCLUDED_COLUMNS = "excluded_columns";

// Preprocessing Settings
constexpr const char *PP_SKEW_THRESHOLD = "skew_threshold";
constexpr const char *PP_ROBUST_CENTERING = "robust_centering";
constexpr const char *PP_QUANTILE_LOW = "quantile_low";
constexpr const char *PP_QUANTILE_HIGH = "quantile_high";

// Training Settings
constexpr const char *TR_LEARNING_RATE = "learning_rate";
constexpr const char *TR_NUM_LEAVES = "num_leaves";
constexpr const char *TR_FEATURE_FRACTION = "feature_fraction";
constexpr const char *TR_BAGGING_FRACTION = "bagging_fraction";
constexpr const char *TR_BAGGING_FREQ = "bagging_freq";
constexpr const char *TR_MAX_ROUNDS = "max_rounds";
constexpr const char *TR_EARLY_STOPPING_ROUNDS = "early_stopping_rounds";
constexpr const char *TR_MIN_DELTA = "min_delta";
constexpr const char *TR_MONITOR_METRIC = "monitor_metric";
constexpr const char *TR_MIN_DATA_IN_LEAF = "min_data_in_leaf";
constexpr const char *TR_LAMBDA_L2 = "lambda_l2";
constexpr const char *TR_NUM_THREADS = "num_threads";
constexpr const char *TR_SEED = "seed";

// Output Settings
constexpr const char *OUT_DIR = "output_dir";
constexpr const char *OUT_MODEL_FILE = "model_file";
constexpr const char *OUT_METADATA_FILE = "metadata_file";
constexpr const char *OUT_REPORT_FILE = "report_file";
constexpr const char *OUT_IMPORTANCE_FILE = "importance_file";
constexpr const char *OUT_TRANSFORM_STATE_FILE = "transform_state_file";
constexpr const char *OUT_METRICS_FILE = "metrics_file";
constexpr const char *OUT_IMPORTANCE_TYPE = "importance_type";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct DatasetConfig {
  // When false the pipeline starts from an already extracted data_dir
  bool unpack = true;
  std::string archive_dir = "data/archives";
  std::string extract_dir = "data/extracted";
  // Defaults to extract_dir when empty
  std::string data_dir;
  std::string top_level_archive = "all_attack_benign_samples.tar.xz";
  std::string checksum_manifest;
  bool require_checksums = true;
  bool require_top_level_checksum = false;

  int time_window = 1;
  std::string benign_class = "benign";
  std::string label_column = "label";
};

struct SplitConfig {
  double test_fraction = 0.2;
  double validation_fraction = 0.1;
  uint64_t seed = 42;
};

// Empty column lists mean "infer once from the loaded training window"
struct SchemaConfig {
  std::vector<std::string> numeric_columns;
  std::vector<std::string> categorical_columns;
  std::vector<std::string> excluded_columns;
};

struct PreprocessingConfig {
  double skew_threshold = 1.0;
  bool robust_centering = true;
  double quantile_low = 25.0;
  double quantile_high = 75.0;
};

struct TrainingConfig {
  double learning_rate = 0.05;
  int num_leaves = 31;
  double feature_fraction = 0.8;
  double bagging_fraction = 0.8;
  int bagging_freq = 1;
  int max_rounds = 1000;
  int early_stopping_rounds = 50;
  double min_delta = 0.0;
  std::string monitor_metric = "multi_logloss";
  int min_data_in_leaf = 20;
  double lambda_l2 = 0.0;
  int num_threads = 0;
  int seed = 42;
};

struct OutputConfig {
  std::string output_dir = "output";
  std::string model_file = "model.txt";
  std::string metadata_file = "model_metadata.json";
  std::string report_file = "evaluation_report.json";
  std::string importance_file = "feature_importance.csv";
  std::string transform_state_file = "transform_state.json";
  std::string metrics_file = "run_metrics.json";
  // "split" or "gain"
  std::string importance_type = "gain";
};

struct AppConfig {
  DatasetConfig dataset;
  SplitConfig split;
  SchemaConfig schema;
  PreprocessingConfig preprocessing;
  TrainingConfig training;
  OutputConfig output;
  LoggingConfig logging;

  std::string resolved_data_dir() const {
    return dataset.data_dir.empty() ? dataset.extract_dir : dataset.data_dir;
  }
};

LogLevel string_to_log_level(const std::string &level_str_raw);
bool string_to_bool(const std::string &val_str_raw);

// Fills `config` from an INI file. Returns false if the file cannot be read.
bool parse_config_into(const std::string &filepath, AppConfig &config);

// Appends one message per violated constraint; returns true if none.
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Default per-component log levels (WARN everywhere, INFO for CORE)
LoggingConfig default_logging_config();

class ConfigManager {
public:
  ConfigManager();
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
