#include "internal/source/source_catalog.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixture_sources.hpp"

namespace {

using cpandb::source::ExtractSource;
using cpandb::source::SourceCatalog;
using cpandb::source::SourceKind;

ExtractSource Database(const std::string& alias, const std::filesystem::path& path, bool required) {
  ExtractSource source;
  source.alias    = alias;
  source.kind     = SourceKind::Database;
  source.path     = path;
  source.required = required;
  return source;
}

void TestInvalidAndDuplicateAliasesAreRejected() {
  SourceCatalog catalog;
  catalog.Add(Database("cpan", "/tmp/x.sqlite", true));

  bool duplicate = false;
  try {
    catalog.Add(Database("cpan", "/tmp/y.sqlite", false));
  } catch (const cpandb::util::ConfigError&) {
    duplicate = true;
  }
  assert(duplicate);

  bool invalid = false;
  try {
    catalog.Add(Database("bad alias; DROP", "/tmp/z.sqlite", false));
  } catch (const cpandb::util::ConfigError&) {
    invalid = true;
  }
  assert(invalid);
}

void TestMissingRequiredSourceFailsVerify() {
  const auto dir = cpandb::testing::MakeTempDir("source_catalog_required");

  SourceCatalog catalog;
  catalog.Add(Database("cpan", dir / "absent.sqlite", true));

  bool threw = false;
  try {
    catalog.Verify();
  } catch (const cpandb::util::SourceMissing&) {
    threw = true;
  }
  assert(threw);
}

void TestOptionalSourcesDegrade() {
  const auto dir = cpandb::testing::MakeTempDir("source_catalog_optional");
  cpandb::testing::WriteDatabase(dir / "present.sqlite", {"CREATE TABLE t (x INTEGER);", "INSERT INTO t VALUES (42);"});

  SourceCatalog catalog;
  catalog.Add(Database("present", dir / "present.sqlite", false));
  catalog.Add(Database("absent", dir / "absent.sqlite", false));

  ExtractSource csv;
  csv.alias = "ratings";
  csv.kind  = SourceKind::Csv;
  csv.path  = dir / "ratings.csv";
  csv.age   = std::make_shared<cpandb::source::FileModifiedAge>();
  cpandb::testing::WriteText(csv.path, "distribution,rating,review_count\n");
  catalog.Add(csv);

  catalog.Verify();
  catalog.ReportAges();

  auto store = cpandb::db::Store::Open((dir / "main.sqlite").string());
  catalog.AttachAll(*store);

  assert(catalog.IsAttached("present"));
  assert(!catalog.IsAttached("absent"));
  assert(!catalog.IsAttached("ratings"));
  assert(catalog.IsAvailable("ratings"));
  assert(!catalog.IsAvailable("absent"));
  assert(catalog.Find("nothing") == nullptr);

  assert(store->HasTable("t", "present"));
  assert(store->QueryInt("SELECT x FROM present.t;").value() == 42);

  // extracts are attached read-only
  bool threw = false;
  try {
    store->Exec("INSERT INTO present.t VALUES (1);");
  } catch (const cpandb::util::StoreError&) {
    threw = true;
  }
  assert(threw);

  catalog.DetachAll(*store);
  assert(!catalog.IsAttached("present"));
}

void TestFileModifiedAge() {
  const auto dir = cpandb::testing::MakeTempDir("source_catalog_age");
  cpandb::testing::WriteText(dir / "fresh.csv", "x\n");

  cpandb::source::FileModifiedAge age;
  auto                            days = age.AgeDays(dir / "fresh.csv");
  assert(days.has_value());
  assert(*days == 0);
  assert(!age.AgeDays(dir / "absent.csv").has_value());

  cpandb::source::NoSourceAge none;
  assert(!none.AgeDays(dir / "fresh.csv").has_value());
}

} // namespace

int main() {
  TestInvalidAndDuplicateAliasesAreRejected();
  TestMissingRequiredSourceFailsVerify();
  TestOptionalSourcesDegrade();
  TestFileModifiedAge();

  std::cout << "cpandb_unit_source_catalog: pass\n";
  return 0;
}
