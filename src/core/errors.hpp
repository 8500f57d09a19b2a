#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

// Root of every failure the pipeline reports. Each subclass carries enough
// context to reproduce the failure without re-running the whole pipeline.
class PipelineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

// Checksum mismatch, or a missing/invalid checksum record where one is
// required. Always raised before the archive is opened for extraction.
class IntegrityError : public PipelineError {
public:
  IntegrityError(std::string archive_name, std::string expected,
                 std::string actual, const std::string &message)
      : PipelineError("[" + archive_name + "] " + message),
        archive_name_(std::move(archive_name)),
        expected_(std::move(expected)), actual_(std::move(actual)) {}

  const std::string &archive_name() const { return archive_name_; }
  const std::string &expected_digest() const { return expected_; }
  const std::string &actual_digest() const { return actual_; }

private:
  std::string archive_name_;
  std::string expected_;
  std::string actual_;
};

class ExtractionError : public PipelineError {
public:
  ExtractionError(std::string archive_name, const std::string &message)
      : PipelineError("[" + archive_name + "] " + message),
        archive_name_(std::move(archive_name)) {}

  const std::string &archive_name() const { return archive_name_; }

private:
  std::string archive_name_;
};

class DatasetIncompleteError : public PipelineError {
public:
  DatasetIncompleteError(int time_window, const std::string &message)
      : PipelineError("time window " + std::to_string(time_window) + ": " +
                      message),
        time_window_(time_window) {}

  int time_window() const { return time_window_; }

private:
  int time_window_;
};

class SchemaError : public PipelineError {
public:
  SchemaError(std::string column, const std::string &message)
      : PipelineError("column '" + column + "': " + message),
        column_(std::move(column)) {}

  const std::string &column() const { return column_; }

private:
  std::string column_;
};

class EmptyColumnError : public PipelineError {
public:
  explicit EmptyColumnError(std::string feature)
      : PipelineError("feature '" + feature +
                      "' has no values in the training split"),
        feature_(std::move(feature)) {}

  const std::string &feature() const { return feature_; }

private:
  std::string feature_;
};

// Raised when a training or validation loss turns non-finite. The model
// truncated to the best round seen so far travels with the error so the
// caller can still persist it.
class TrainingDivergedError : public PipelineError {
public:
  TrainingDivergedError(int round, int last_valid_round, int best_round,
                        std::string best_model)
      : PipelineError("loss became non-finite at round " +
                      std::to_string(round) + " (last valid round " +
                      std::to_string(last_valid_round) + ")"),
        round_(round), last_valid_round_(last_valid_round),
        best_round_(best_round), best_model_(std::move(best_model)) {}

  int round() const { return round_; }
  int last_valid_round() const { return last_valid_round_; }
  int best_round() const { return best_round_; }
  const std::string &best_model() const { return best_model_; }

private:
  int round_;
  int last_valid_round_;
  int best_round_;
  std::string best_model_;
};

#endif // ERRORS_HPP
