#include "internal/observability/logging.hpp"

#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/config.pb.h"
#include "tests/support/fixture_sources.hpp"

namespace {

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestFieldsAreWrittenToTheLogFile() {
  const auto dir  = cpandb::testing::MakeTempDir("logging_file");
  const auto file = dir / "generator.log";

  cpandb::runtime::config::LoggingConfig config;
  config.set_level("debug");
  config.set_pattern("%l %v");
  config.set_file(file.string());
  cpandb::observability::InitializeLogging(config);

  CPANDB_LOG_INFO("stage finished", {cpandb::observability::StringField("stage", "merge"),
                                     cpandb::observability::IntField("elapsed_ms", 12)});
  CPANDB_LOG_WARN("source missing", {cpandb::observability::StringField("path", "/tmp/with space.sqlite"),
                                     cpandb::observability::BoolField("required", false)});
  CPANDB_LOG_DEBUG("plain");
  cpandb::observability::ShutdownLogging();

  const auto text = ReadAll(file);
  assert(text.find("info stage finished stage=merge elapsed_ms=12") != std::string::npos);
  assert(text.find("warning source missing path=\"/tmp/with space.sqlite\" required=false") != std::string::npos);
  assert(text.find("debug plain") != std::string::npos);
}

void TestLevelFiltersMessages() {
  const auto dir  = cpandb::testing::MakeTempDir("logging_level");
  const auto file = dir / "generator.log";

  cpandb::runtime::config::LoggingConfig config;
  config.set_level("warn");
  config.set_pattern("%v");
  config.set_file(file.string());
  cpandb::observability::InitializeLogging(config);

  CPANDB_LOG_INFO("hidden");
  CPANDB_LOG_ERROR("shown", {cpandb::observability::StringField("error", "")});
  cpandb::observability::ShutdownLogging();

  const auto text = ReadAll(file);
  assert(text.find("hidden") == std::string::npos);
  assert(text.find("shown error=\"\"") != std::string::npos);
}

} // namespace

int main() {
  TestFieldsAreWrittenToTheLogFile();
  TestLevelFiltersMessages();

  std::cout << "cpandb_unit_logging: pass\n";
  return 0;
}
