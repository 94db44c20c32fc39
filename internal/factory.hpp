#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/pipeline/generator.hpp"
#include "internal/source/source_catalog.hpp"

namespace cpandb::factory {

/*
  Composition root.

  The only place that maps RuntimeConfig onto concrete stage options and
  extract sources. Expects a config that already went through
  ConfigLoader::ApplyDefaults.
*/
source::SourceCatalog BuildCatalog(const cpandb::runtime::config::SourcesConfig& sources);

pipeline::GeneratorOptions BuildOptions(const cpandb::runtime::config::RuntimeConfig& config);

std::unique_ptr<pipeline::Generator> Build(const cpandb::runtime::config::RuntimeConfig& config);

} // namespace cpandb::factory
