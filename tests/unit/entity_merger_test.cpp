#include "internal/pipeline/entity_merger.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "config/config.pb.h"

#include "internal/db/store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/normalizer.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixture_sources.hpp"

namespace {

using cpandb::db::Store;
using cpandb::pipeline::EntityMerger;
using cpandb::pipeline::Normalizer;

std::optional<std::string> Text(Store& store, const std::string& sql) {
  std::optional<std::string> value;
  store.QueryEach(sql, {}, [&](const cpandb::db::sql::Row& row) { value = row.GetOptionalText(0); });
  return value;
}

void TestLeftJoinsKeepEveryDistribution() {
  const auto sources = cpandb::testing::WriteFooBarSources(cpandb::testing::MakeTempDir("entity_merger_full"));
  auto       catalog = cpandb::factory::BuildCatalog(cpandb::testing::MakeConfig(sources).sources());

  auto store = Store::Open((sources.dir / "store.sqlite").string());
  catalog.AttachAll(*store);
  Normalizer(*store, catalog).Run();

  EntityMerger merger(*store, catalog, 1);
  auto         stats = merger.Run();

  assert(stats.authors == 3);
  assert(stats.distributions == 2);
  assert(stats.modules == 3);
  assert(stats.tickets == 1);
  assert(stats.ratings_applied == 1);
  assert(stats.ratings_unmatched == 1);
  assert(stats.meta_applied == 2);
  assert(stats.meta_unmatched == 1);

  // the newest Foo row wins
  assert(*Text(*store, "SELECT version FROM distribution WHERE distribution = 'Foo';") == "1.0");
  assert(*Text(*store, "SELECT release FROM distribution WHERE distribution = 'Foo';") == "AKI/Foo-1.0.tar.gz");
  assert(*Text(*store, "SELECT uploaded FROM distribution WHERE distribution = 'Foo';") == "2010-01-01");
  assert(store->QueryInt("SELECT pass FROM distribution WHERE distribution = 'Foo';").value() == 10);
  assert(*Text(*store, "SELECT rating FROM distribution WHERE distribution = 'Foo';") == "4.5");
  assert(store->QueryInt("SELECT ratings FROM distribution WHERE distribution = 'Foo';").value() == 12);
  assert(*Text(*store, "SELECT license FROM distribution WHERE distribution = 'Foo';") == "perl");

  // Bar has no uploads, testers or ratings and is still present
  assert(!Text(*store, "SELECT uploaded FROM distribution WHERE distribution = 'Bar';").has_value());
  assert(!Text(*store, "SELECT pass FROM distribution WHERE distribution = 'Bar';").has_value());
  assert(!Text(*store, "SELECT rating FROM distribution WHERE distribution = 'Bar';").has_value());
  assert(store->QueryInt("SELECT meta FROM distribution WHERE distribution = 'Bar';").value() == 1);

  assert(*Text(*store, "SELECT name FROM author WHERE author = 'BOB';") == "BOB");
  assert(*Text(*store, "SELECT version FROM module WHERE module = 'Foo';") == "1.0");
  assert(*Text(*store, "SELECT severity FROM ticket WHERE id = 1;") == "normal");
  assert(*Text(*store, "SELECT created FROM ticket WHERE id = 1;") == "2011-02-03");

  assert(store->Count("distribution", "weight = 0 AND volatility = 0") == 2);
}

void TestMissingOptionalExtractsLeaveNulls() {
  const auto dir     = cpandb::testing::MakeTempDir("entity_merger_minimal");
  const auto sources = cpandb::testing::WriteFooBarSources(dir);
  std::filesystem::remove(sources.upload);
  std::filesystem::remove(sources.testers);
  std::filesystem::remove(sources.rt);
  std::filesystem::remove(sources.ratings);

  auto catalog = cpandb::factory::BuildCatalog(cpandb::testing::MakeConfig(sources).sources());
  auto store   = Store::Open((dir / "store.sqlite").string());
  catalog.AttachAll(*store);
  Normalizer(*store, catalog).Run();

  EntityMerger merger(*store, catalog, 100);
  auto         stats = merger.Run();

  assert(stats.distributions == 2);
  assert(stats.tickets == 0);
  assert(stats.ratings_applied == 0);
  assert(store->Count("distribution", "uploaded IS NULL AND pass IS NULL AND rating IS NULL") == 2);
  assert(store->Count("distribution", "meta = 1") == 2);
}

void TestMissingPackageIndexIsFatal() {
  const auto dir     = cpandb::testing::MakeTempDir("entity_merger_no_cpan");
  const auto sources = cpandb::testing::WriteFooBarSources(dir);
  std::filesystem::remove(sources.cpan);

  auto catalog = cpandb::factory::BuildCatalog(cpandb::testing::MakeConfig(sources).sources());
  auto store   = Store::Open((dir / "store.sqlite").string());
  catalog.AttachAll(*store);

  bool threw = false;
  try {
    Normalizer(*store, catalog).Run();
  } catch (const cpandb::util::SourceMissing&) {
    threw = true;
  }
  assert(threw);
}

// shuts logging down, so it runs last
void TestUnmatchedBackfillKeysAreLogged() {
  const auto sources = cpandb::testing::WriteFooBarSources(cpandb::testing::MakeTempDir("entity_merger_unmatched"));
  auto       catalog = cpandb::factory::BuildCatalog(cpandb::testing::MakeConfig(sources).sources());
  const auto log     = sources.dir / "merge.log";

  cpandb::runtime::config::LoggingConfig logging;
  logging.set_level("debug");
  logging.set_pattern("%v");
  logging.set_file(log.string());
  cpandb::observability::InitializeLogging(logging);

  auto store = Store::Open((sources.dir / "store.sqlite").string());
  catalog.AttachAll(*store);
  Normalizer(*store, catalog).Run();
  EntityMerger(*store, catalog, 2).Run();
  cpandb::observability::ShutdownLogging();

  std::ifstream      in(log);
  std::ostringstream text;
  text << in.rdbuf();
  assert(text.str().find("META data for unknown release release=ZED/Gone-1.tar.gz") != std::string::npos);
  assert(text.str().find("rating for unknown distribution distribution=Ghost") != std::string::npos);
}

} // namespace

int main() {
  TestLeftJoinsKeepEveryDistribution();
  TestMissingOptionalExtractsLeaveNulls();
  TestMissingPackageIndexIsFatal();
  TestUnmatchedBackfillKeysAreLogged();

  std::cout << "cpandb_unit_entity_merger: pass\n";
  return 0;
}
