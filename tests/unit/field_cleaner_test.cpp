#include "internal/pipeline/field_cleaner.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/db/sql/schema.hpp"
#include "internal/db/store.hpp"
#include "tests/support/fixture_sources.hpp"

namespace {

using cpandb::db::Store;
using cpandb::pipeline::FieldCleaner;

void TestCleanVersionKeepsTheBareToken() {
  assert(*FieldCleaner::CleanVersion(std::string(">= 1.2")) == "1.2");
  assert(*FieldCleaner::CleanVersion(std::string("v5.10.1")) == "5.10.1");
  assert(*FieldCleaner::CleanVersion(std::string("<2")) == "2");
  assert(*FieldCleaner::CleanVersion(std::string("== 0.01_02")) == "0.01_02");
  assert(*FieldCleaner::CleanVersion(std::string("v")) == "");
  assert(!FieldCleaner::CleanVersion(std::nullopt).has_value());
}

void TestNeedsCleaningOnlyForComparatorsAndV() {
  assert(FieldCleaner::NeedsCleaning(">1"));
  assert(FieldCleaner::NeedsCleaning("V1"));
  assert(FieldCleaner::NeedsCleaning("=1"));
  assert(!FieldCleaner::NeedsCleaning("1.0"));
  assert(!FieldCleaner::NeedsCleaning(""));
  assert(!FieldCleaner::NeedsCleaning("1.0 <"));
}

std::optional<std::string> VersionOf(Store& store, const std::string& module) {
  std::optional<std::string> version;
  store.QueryEach("SELECT version FROM t_requires WHERE module = ?;", {module},
                  [&](const cpandb::db::sql::Row& row) { version = row.GetOptionalText(0); });
  return version;
}

void TestRunRewritesAndDefaults() {
  const auto dir   = cpandb::testing::MakeTempDir("field_cleaner_run");
  auto       store = Store::Open((dir / "store.sqlite").string());
  store->Exec(cpandb::db::sql::CREATE_T_REQUIRES);

  const char* insert = "INSERT INTO t_requires VALUES ('Foo', ?, ?, 'runtime', ?);";
  store->Exec(insert, {std::string("A"), std::string(">= 1.5"), nullptr});
  store->Exec(insert, {std::string("B"), std::string("v5.8.1"), std::string("v5.6")});
  store->Exec(insert, {std::string("C"), nullptr, nullptr});
  store->Exec(insert, {std::string("D"), std::string(""), std::string("5.008")});
  store->Exec(insert, {std::string("E"), std::string("2.0"), std::string("")});

  FieldCleaner cleaner(*store);
  auto         stats = cleaner.Run();

  assert(*VersionOf(*store, "A") == "1.5");
  assert(*VersionOf(*store, "B") == "5.8.1");
  assert(*VersionOf(*store, "C") == "0");
  assert(*VersionOf(*store, "D") == "0");
  assert(*VersionOf(*store, "E") == "2.0");

  assert(store->Count("t_requires", "module = 'B' AND core = '5.6'") == 1);
  assert(store->Count("t_requires", "module = 'D' AND core = 0") == 1);
  assert(store->Count("t_requires", "module = 'E' AND core = 0") == 1);
  assert(store->Count("t_requires", "version IS NULL OR version = ''") == 0);

  assert(stats.versions_rewritten == 2);
  assert(stats.cores_rewritten == 1);
  assert(stats.versions_defaulted == 2);
  assert(stats.cores_defaulted == 1);

  // a second pass finds nothing left to do
  auto again = cleaner.Run();
  assert(again.versions_rewritten == 0);
  assert(again.cores_rewritten == 0);
  assert(again.versions_defaulted == 0);
  assert(again.cores_defaulted == 0);
}

} // namespace

int main() {
  TestCleanVersionKeepsTheBareToken();
  TestNeedsCleaningOnlyForComparatorsAndV();
  TestRunRewritesAndDefaults();

  std::cout << "cpandb_unit_field_cleaner: pass\n";
  return 0;
}
