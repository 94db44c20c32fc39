#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using cpandb::observability::IntField;
using cpandb::observability::StringField;

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: cpandb-generator <config.yaml> OR cpandb-generator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = cpandb::config::ConfigLoader::LoadFromYaml(config_path);

    cpandb::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build and run one generation
    // ------------------------------------------------------------
    auto generator = cpandb::factory::Build(config);
    const auto summary = generator->Run();

    CPANDB_LOG_INFO("CPANDB generated",
                    {StringField("path", config.output().path()), IntField("authors", summary.authors),
                     IntField("distributions", summary.distributions), IntField("modules", summary.modules),
                     IntField("dependencies", summary.dependencies), IntField("requires", summary.requires_rows),
                     IntField("tickets", summary.tickets)});

    cpandb::observability::ShutdownLogging();
  } catch (const cpandb::util::StageFailure& e) {
    CPANDB_LOG_ERROR("Generation failed", {StringField("stage", e.Stage()), StringField("error", e.what())});
    cpandb::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    CPANDB_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    cpandb::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
