#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace cpandb::db {

// Outcome of one keyed write in a backfill pass.
enum class ErrorCode {
  OK = 0,

  // the key matched no row; the pass goes on
  NotFound,
};

/*
  Per-row outcome for the store layer.

  Statement failures never come back as a Result; they throw
  util::StoreError and end the stage.
*/
struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;
  int64_t     rows = 0;

  static Result Ok(int64_t rows) {
    return {ErrorCode::OK, {}, rows};
  }

  static Result NotFound(std::string msg) {
    return {ErrorCode::NotFound, std::move(msg), 0};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace cpandb::db
