#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cpandb::util {

/*
  Central error types.

  Every fatal condition in the pipeline is one of these; the generator
  wraps whatever a stage throws into a StageFailure naming the stage.
*/

// A statement or store-level operation failed. Carries the statement text.
class StoreError : public std::runtime_error {
 public:
  StoreError(const std::string& msg, std::string statement)
      : std::runtime_error(statement.empty() ? msg : msg + " [" + statement + "]"), statement_(std::move(statement)) {
  }

  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }

  const std::string& Statement() const {
    return statement_;
  }

 private:
  std::string statement_;
};

// A required raw extract is not available.
class SourceMissing : public std::runtime_error {
 public:
  explicit SourceMissing(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StageFailure : public std::runtime_error {
 public:
  StageFailure(std::string stage, const std::string& msg)
      : std::runtime_error("stage '" + stage + "' failed: " + msg), stage_(std::move(stage)) {
  }

  const std::string& Stage() const {
    return stage_;
  }

 private:
  std::string stage_;
};

} // namespace cpandb::util
