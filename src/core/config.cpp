#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.verify", LogComponent::IO_VERIFY},
    {"io.extract", LogComponent::IO_EXTRACT},
    {"data.loader", LogComponent::DATA_LOADER},
    {"data.split", LogComponent::DATA_SPLIT},
    {"preprocess", LogComponent::PREPROCESS},
    {"train", LogComponent::TRAIN},
    {"eval", LogComponent::EVAL},
    {"output", LogComponent::OUTPUT}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

LoggingConfig default_logging_config() {
  LoggingConfig logging;
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  return logging;
}

// Validation functions for configuration parameters
bool validate_dataset_config(const DatasetConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.time_window < 1 || config.time_window > 10) {
    errors.push_back("Dataset time window must be between 1 and 10 seconds");
    valid = false;
  }

  if (config.unpack && config.archive_dir.empty()) {
    errors.push_back("Dataset archive_dir cannot be empty when unpack is "
                     "enabled");
    valid = false;
  }

  if (config.extract_dir.empty() && config.data_dir.empty()) {
    errors.push_back("Dataset needs either extract_dir or data_dir");
    valid = false;
  }

  if (config.benign_class.empty()) {
    errors.push_back("Dataset benign_class cannot be empty");
    valid = false;
  }

  if (config.label_column.empty()) {
    errors.push_back("Dataset label_column cannot be empty");
    valid = false;
  }

  return valid;
}

bool validate_split_config(const SplitConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (config.test_fraction <= 0.0 || config.test_fraction >= 1.0) {
    errors.push_back("Split test fraction must be between 0 and 1 "
                     "(exclusive)");
    valid = false;
  }

  if (config.validation_fraction <= 0.0 ||
      config.validation_fraction >= 1.0) {
    errors.push_back("Split validation fraction must be between 0 and 1 "
                     "(exclusive)");
    valid = false;
  }

  if (config.test_fraction + config.validation_fraction >= 0.9) {
    errors.push_back("Split test and validation fractions must leave at "
                     "least 10% of the rows for training");
    valid = false;
  }

  return valid;
}

bool validate_schema_config(const SchemaConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  for (const auto &column : config.numeric_columns) {
    if (std::find(config.categorical_columns.begin(),
                  config.categorical_columns.end(),
                  column) != config.categorical_columns.end()) {
      errors.push_back("Schema column '" + column +
                       "' is declared both numeric and categorical");
      valid = false;
    }
  }

  return valid;
}

bool validate_preprocessing_config(const PreprocessingConfig &config,
                                   std::vector<std::string> &errors) {
  bool valid = true;

  if (config.skew_threshold < 0.0) {
    errors.push_back("Preprocessing skew threshold must be non-negative");
    valid = false;
  }

  if (config.quantile_low < 0.0 || config.quantile_high > 100.0 ||
      config.quantile_low >= config.quantile_high) {
    errors.push_back("Preprocessing quantile range must satisfy 0 <= low < "
                     "high <= 100");
    valid = false;
  }

  return valid;
}

bool validate_training_config(const TrainingConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.learning_rate <= 0.0 || config.learning_rate > 1.0) {
    errors.push_back("Training learning rate must be in (0, 1]");
    valid = false;
  }

  if (config.num_leaves < 2 || config.num_leaves > 131072) {
    errors.push_back("Training num_leaves must be between 2 and 131072");
    valid = false;
  }

  if (config.feature_fraction <= 0.0 || config.feature_fraction > 1.0) {
    errors.push_back("Training feature fraction must be in (0, 1]");
    valid = false;
  }

  if (config.bagging_fraction <= 0.0 || config.bagging_fraction > 1.0) {
    errors.push_back("Training bagging fraction must be in (0, 1]");
    valid = false;
  }

  if (config.bagging_freq < 0) {
    errors.push_back("Training bagging frequency must be non-negative");
    valid = false;
  }

  if (config.max_rounds < 1) {
    errors.push_back("Training max rounds must be at least 1");
    valid = false;
  }

  if (config.early_stopping_rounds < 1) {
    errors.push_back("Training early stopping rounds must be at least 1");
    valid = false;
  }

  if (config.min_delta < 0.0) {
    errors.push_back("Training min delta must be non-negative");
    valid = false;
  }

  if (config.monitor_metric != "multi_logloss" &&
      config.monitor_metric != "multi_error") {
    errors.push_back("Training monitor metric must be one of: multi_logloss, "
                     "multi_error");
    valid = false;
  }

  if (config.min_data_in_leaf < 1) {
    errors.push_back("Training min data in leaf must be at least 1");
    valid = false;
  }

  if (config.lambda_l2 < 0.0) {
    errors.push_back("Training lambda_l2 must be non-negative");
    valid = false;
  }

  if (config.num_threads < 0) {
    errors.push_back("Training num_threads must be non-negative (0 = all "
                     "cores)");
    valid = false;
  }

  return valid;
}

bool validate_output_config(const OutputConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.output_dir.empty()) {
    errors.push_back("Output directory cannot be empty");
    valid = false;
  }

  if (config.importance_type != "split" && config.importance_type != "gain") {
    errors.push_back("Output importance type must be one of: split, gain");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_dataset_config(config.dataset, errors))
    valid = false;

  if (!validate_split_config(config.split, errors))
    valid = false;

  if (!validate_schema_config(config.schema, errors))
    valid = false;

  if (!validate_preprocessing_config(config.preprocessing, errors))
    valid = false;

  if (!validate_training_config(config.training, errors))
    valid = false;

  if (!validate_output_config(config.output, errors))
    valid = false;

  // Cross-section validation
  const auto &excluded = config.schema.excluded_columns;
  if (std::find(config.schema.numeric_columns.begin(),
                config.schema.numeric_columns.end(),
                config.dataset.label_column) !=
      config.schema.numeric_columns.end()) {
    errors.push_back("The label column cannot be declared as a numeric "
                     "feature");
    valid = false;
  }

  for (const auto &column : excluded) {
    if (column == config.dataset.label_column) {
      errors.push_back("The label column is always excluded; remove it from "
                       "excluded_columns");
      valid = false;
    }
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  config.logging = default_logging_config();

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    bool known_key = true;
    try {
      if (current_section == "Dataset") {
        if (key == Keys::DS_UNPACK)
          config.dataset.unpack = string_to_bool(value);
        else if (key == Keys::DS_ARCHIVE_DIR)
          config.dataset.archive_dir = value;
        else if (key == Keys::DS_EXTRACT_DIR)
          config.dataset.extract_dir = value;
        else if (key == Keys::DS_DATA_DIR)
          config.dataset.data_dir = value;
        else if (key == Keys::DS_TOP_LEVEL_ARCHIVE)
          config.dataset.top_level_archive = value;
        else if (key == Keys::DS_CHECKSUM_MANIFEST)
          config.dataset.checksum_manifest = value;
        else if (key == Keys::DS_REQUIRE_CHECKSUMS)
          config.dataset.require_checksums = string_to_bool(value);
        else if (key == Keys::DS_REQUIRE_TOP_LEVEL_CHECKSUM)
          config.dataset.require_top_level_checksum = string_to_bool(value);
        else if (key == Keys::DS_TIME_WINDOW)
          config.dataset.time_window =
              Utils::string_to_number<int>(value).value_or(
                  config.dataset.time_window);
        else if (key == Keys::DS_BENIGN_CLASS)
          config.dataset.benign_class = value;
        else if (key == Keys::DS_LABEL_COLUMN)
          config.dataset.label_column = value;
        else
          known_key = false;

      } else if (current_section == "Split") {
        if (key == Keys::SP_TEST_FRACTION)
          config.split.test_fraction =
              Utils::string_to_number<double>(value).value_or(
                  config.split.test_fraction);
        else if (key == Keys::SP_VALIDATION_FRACTION)
          config.split.validation_fraction =
              Utils::string_to_number<double>(value).value_or(
                  config.split.validation_fraction);
        else if (key == Keys::SP_SEED)
          config.split.seed = Utils::string_to_number<uint64_t>(value).value_or(
              config.split.seed);
        else
          known_key = false;

      } else if (current_section == "Schema") {
        if (key == Keys::SC_NUMERIC_COLUMNS)
          config.schema.numeric_columns = Utils::split_and_trim(value, ',');
        else if (key == Keys::SC_CATEGORICAL_COLUMNS)
          config.schema.categorical_columns =
              Utils::split_and_trim(value, ',');
        else if (key == Keys::SC_EXCLUDED_COLUMNS)
          config.schema.excluded_columns = Utils::split_and_trim(value, ',');
        else
          known_key = false;

      } else if (current_section == "Preprocessing") {
        if (key == Keys::PP_SKEW_THRESHOLD)
          config.preprocessing.skew_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.preprocessing.skew_threshold);
        else if (key == Keys::PP_ROBUST_CENTERING)
          config.preprocessing.robust_centering = string_to_bool(value);
        else if (key == Keys::PP_QUANTILE_LOW)
          config.preprocessing.quantile_low =
              Utils::string_to_number<double>(value).value_or(
                  config.preprocessing.quantile_low);
        else if (key == Keys::PP_QUANTILE_HIGH)
          config.preprocessing.quantile_high =
              Utils::string_to_number<double>(value).value_or(
                  config.preprocessing.quantile_high);
        else
          known_key = false;

      } else if (current_section == "Training") {
        if (key == Keys::TR_LEARNING_RATE)
          config.training.learning_rate =
              Utils::string_to_number<double>(value).value_or(
                  config.training.learning_rate);
        else if (key == Keys::TR_NUM_LEAVES)
          config.training.num_leaves =
              Utils::string_to_number<int>(value).value_or(
                  config.training.num_leaves);
        else if (key == Keys::TR_FEATURE_FRACTION)
          config.training.feature_fraction =
              Utils::string_to_number<double>(value).value_or(
                  config.training.feature_fraction);
        else if (key == Keys::TR_BAGGING_FRACTION)
          config.training.bagging_fraction =
              Utils::string_to_number<double>(value).value_or(
                  config.training.bagging_fraction);
        else if (key == Keys::TR_BAGGING_FREQ)
          config.training.bagging_freq =
              Utils::string_to_number<int>(value).value_or(
                  config.training.bagging_freq);
        else if (key == Keys::TR_MAX_ROUNDS)
          config.training.max_rounds =
              Utils::string_to_number<int>(value).value_or(
                  config.training.max_rounds);
        else if (key == Keys::TR_EARLY_STOPPING_ROUNDS)
          config.training.early_stopping_rounds =
              Utils::string_to_number<int>(value).value_or(
                  config.training.early_stopping_rounds);
        else if (key == Keys::TR_MIN_DELTA)
          config.training.min_delta =
              Utils::string_to_number<double>(value).value_or(
                  config.training.min_delta);
        else if (key == Keys::TR_MONITOR_METRIC)
          config.training.monitor_metric = Utils::to_lower_copy(value);
        else if (key == Keys::TR_MIN_DATA_IN_LEAF)
          config.training.min_data_in_leaf =
              Utils::string_to_number<int>(value).value_or(
                  config.training.min_data_in_leaf);
        else if (key == Keys::TR_LAMBDA_L2)
          config.training.lambda_l2 =
              Utils::string_to_number<double>(value).value_or(
                  config.training.lambda_l2);
        else if (key == Keys::TR_NUM_THREADS)
          config.training.num_threads =
              Utils::string_to_number<int>(value).value_or(
                  config.training.num_threads);
        else if (key == Keys::TR_SEED)
          config.training.seed = Utils::string_to_number<int>(value).value_or(
              config.training.seed);
        else
          known_key = false;

      } else if (current_section == "Output") {
        if (key == Keys::OUT_DIR)
          config.output.output_dir = value;
        else if (key == Keys::OUT_MODEL_FILE)
          config.output.model_file = value;
        else if (key == Keys::OUT_METADATA_FILE)
          config.output.metadata_file = value;
        else if (key == Keys::OUT_REPORT_FILE)
          config.output.report_file = value;
        else if (key == Keys::OUT_IMPORTANCE_FILE)
          config.output.importance_file = value;
        else if (key == Keys::OUT_TRANSFORM_STATE_FILE)
          config.output.transform_state_file = value;
        else if (key == Keys::OUT_METRICS_FILE)
          config.output.metrics_file = value;
        else if (key == Keys::OUT_IMPORTANCE_TYPE)
          config.output.importance_type = Utils::to_lower_copy(value);
        else
          known_key = false;

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "data.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            bool matched = false;
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0) {
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
                matched = true;
              }
            }
            known_key = matched;
          } else
            known_key = false;
        }
      } else {
        known_key = false;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }

    if (!known_key)
      std::cerr << "Warning (Config Line " << line_num << "): Unknown key '"
                << key << "' in section [" << current_section << "]"
                << std::endl;
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

ConfigManager::ConfigManager() {
  auto defaults = std::make_shared<AppConfig>();
  defaults->logging = default_logging_config();
  current_config_ = defaults;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
