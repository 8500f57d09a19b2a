#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "pipeline/pipeline_runner.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#endif

namespace {

// Distinct exit status per failure class so callers can script around them
enum ExitCode : int {
  EXIT_OK = 0,
  EXIT_UNEXPECTED = 1,
  EXIT_CONFIG = 2,
  EXIT_INTEGRITY = 3,
  EXIT_EXTRACTION = 4,
  EXIT_DATASET_INCOMPLETE = 5,
  EXIT_SCHEMA = 6,
  EXIT_EMPTY_COLUMN = 7,
  EXIT_TRAINING_DIVERGED = 8,
  EXIT_PIPELINE = 9,
  EXIT_CANCELLED = 130
};

} // namespace

// Checked between archives and between boosting rounds
std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

int main(int argc, char *argv[]) {
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  if (!config_manager.load_configuration(config_file_to_load)) {
    std::cerr << "Unusable configuration file: " << config_file_to_load
              << std::endl;
    return EXIT_CONFIG;
  }

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE,
      "ICS traffic classifier starting, time window "
          << current_config->dataset.time_window << "s");
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());
#endif

  try {
    PipelineRunner runner(*current_config, &g_shutdown_requested);
    RunSummary summary = runner.run();
    if (summary.cancelled) {
      LOG(LogLevel::WARN, LogComponent::CORE,
          "Run cancelled by signal, artifacts are incomplete");
      return EXIT_CANCELLED;
    }

    LOG(LogLevel::INFO, LogComponent::CORE,
        "Run complete: " << summary.merged_rows << " rows, best round "
                         << summary.best_round << ", test accuracy "
                         << summary.test_accuracy << ", macro F1 "
                         << summary.test_macro_f1);
    return EXIT_OK;
  } catch (const IntegrityError &e) {
    LOG(LogLevel::FATAL, LogComponent::IO_VERIFY,
        "Integrity check failed: " << e.what());
    return EXIT_INTEGRITY;
  } catch (const ExtractionError &e) {
    LOG(LogLevel::FATAL, LogComponent::IO_EXTRACT,
        "Extraction failed: " << e.what());
    return EXIT_EXTRACTION;
  } catch (const DatasetIncompleteError &e) {
    LOG(LogLevel::FATAL, LogComponent::DATA_LOADER,
        "Dataset incomplete: " << e.what());
    return EXIT_DATASET_INCOMPLETE;
  } catch (const SchemaError &e) {
    LOG(LogLevel::FATAL, LogComponent::DATA_LOADER,
        "Schema error: " << e.what());
    return EXIT_SCHEMA;
  } catch (const EmptyColumnError &e) {
    LOG(LogLevel::FATAL, LogComponent::PREPROCESS,
        "Empty feature: " << e.what());
    return EXIT_EMPTY_COLUMN;
  } catch (const TrainingDivergedError &e) {
    LOG(LogLevel::FATAL, LogComponent::TRAIN,
        "Training diverged: " << e.what());
    return EXIT_TRAINING_DIVERGED;
  } catch (const ConfigError &e) {
    LOG(LogLevel::FATAL, LogComponent::CONFIG,
        "Configuration error: " << e.what());
    return EXIT_CONFIG;
  } catch (const PipelineError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Pipeline failed: " << e.what());
    return EXIT_PIPELINE;
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Unexpected error: " << e.what());
    return EXIT_UNEXPECTED;
  }
}
