#include "factory.hpp"

#include <memory>
#include <string>
#include <utility>

#include "internal/source/source_age.hpp"

namespace cpandb::factory {

namespace {

void AddSource(source::SourceCatalog& catalog,
               std::string alias,
               source::SourceKind kind,
               const cpandb::runtime::config::SourceConfig& config) {
  // unconfigured optional extracts are simply absent
  if (config.path().empty() && !config.required()) {
    return;
  }

  source::ExtractSource extract;
  extract.alias    = std::move(alias);
  extract.kind     = kind;
  extract.path     = config.path();
  extract.required = config.required();
  if (config.report_age()) {
    extract.age = std::make_shared<source::FileModifiedAge>();
  }
  catalog.Add(std::move(extract));
}

} // namespace

source::SourceCatalog BuildCatalog(const cpandb::runtime::config::SourcesConfig& sources) {
  source::SourceCatalog catalog;

  // aliases are the schema names the stage SQL refers to
  AddSource(catalog, "cpan", source::SourceKind::Database, sources.cpan());
  AddSource(catalog, "meta", source::SourceKind::Database, sources.meta());
  AddSource(catalog, "upload", source::SourceKind::Database, sources.uploads());
  AddSource(catalog, "testers", source::SourceKind::Database, sources.testers());
  AddSource(catalog, "rt", source::SourceKind::Database, sources.rt());
  AddSource(catalog, "ratings", source::SourceKind::Csv, sources.ratings());

  return catalog;
}

pipeline::GeneratorOptions BuildOptions(const cpandb::runtime::config::RuntimeConfig& config) {
  pipeline::GeneratorOptions options;

  options.output               = config.output().path();
  options.store.journal_mode   = config.output().journal_mode();
  options.store.cache_size_kib = static_cast<int>(config.output().cache_size_kib());

  options.batch_size = config.loader().batch_size();

  options.metrics.excluded_prefixes.assign(config.metrics().excluded_prefixes().begin(),
                                           config.metrics().excluded_prefixes().end());

  options.keep_intermediate = config.finalize().keep_intermediate();
  options.vacuum            = !config.finalize().skip_vacuum();
  options.analyze           = !config.finalize().skip_analyze();

  return options;
}

std::unique_ptr<pipeline::Generator> Build(const cpandb::runtime::config::RuntimeConfig& config) {
  return std::make_unique<pipeline::Generator>(BuildOptions(config), BuildCatalog(config.sources()));
}

} // namespace cpandb::factory
