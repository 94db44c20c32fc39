#include "entity_merger.hpp"

#include <optional>
#include <string>
#include <vector>

#include "internal/db/batch_updater.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/ratings_reader.hpp"

namespace cpandb::pipeline {

using observability::IntField;
using observability::StringField;

namespace {

struct MetaRow {
  std::string                release;
  int64_t                    meta = 0;
  std::optional<std::string> license;
};

} // namespace

EntityMerger::EntityMerger(db::Store& store, const source::SourceCatalog& catalog, uint32_t batch_size)
    : store_(store), catalog_(catalog), batch_size_(batch_size) {
}

EntityMerger::Stats EntityMerger::Run() {
  BuildAuthors();
  BuildDistributions();
  BackfillRatings();
  BackfillMeta();
  BuildModules();
  BuildTickets();
  return stats_;
}

void EntityMerger::BuildAuthors() {
  store_.Exec(db::sql::CREATE_AUTHOR);
  stats_.authors = store_.Exec(
      "INSERT INTO author "
      "SELECT cpanid AS author, COALESCE(fullname, cpanid) AS name "
      "FROM cpan.auths "
      "WHERE cpanid IS NOT NULL "
      "GROUP BY cpanid "
      "ORDER BY author;");
  store_.CreateIndex("author", {"name"});
}

void EntityMerger::BuildDistributions() {
  store_.Exec(db::sql::CREATE_DISTRIBUTION);
  stats_.distributions = store_.Exec(
      "INSERT INTO distribution "
      "SELECT"
      " d.dist AS distribution,"
      " d.version AS version,"
      " d.author AS author,"
      " 0 AS meta,"
      " NULL AS license,"
      " d.release AS release,"
      " ur.uploaded AS uploaded,"
      " t.pass AS pass,"
      " t.fail AS fail,"
      " t.unknown AS unknown,"
      " t.na AS na,"
      " NULL AS rating,"
      " 0 AS ratings,"
      " 0 AS weight,"
      " 0 AS volatility "
      "FROM t_distribution d "
      "LEFT JOIN t_uploaded ur ON ur.release = d.release "
      "LEFT JOIN t_testers t ON t.dist_version = d.dist_version "
      "ORDER BY distribution;");

  // keyed lookups for the META backfill and the requires join
  store_.CreateIndex("distribution", {"release"});
}

void EntityMerger::BackfillRatings() {
  const auto* source = catalog_.Find("ratings");
  if (!source || !catalog_.IsAvailable("ratings")) {
    CPANDB_LOG_WARN("ratings not available, rating columns stay null");
    return;
  }

  auto file = source::RatingsReader::Load(source->path);
  if (file.skipped_lines > 0) {
    CPANDB_LOG_WARN("skipped malformed ratings lines", {IntField("lines", static_cast<int64_t>(file.skipped_lines))});
  }

  db::BatchedUpdater updater(store_, "UPDATE distribution SET rating = ?, ratings = ? WHERE distribution = ?;", batch_size_);
  for (const auto& rating : file.ratings) {
    if (!updater.Apply({db::sql::OptionalText(rating.rating), rating.review_count, rating.distribution})) {
      CPANDB_LOG_DEBUG("rating for unknown distribution", {StringField("distribution", rating.distribution)});
    }
  }
  updater.Finish();

  stats_.ratings_applied   = updater.stats().applied;
  stats_.ratings_unmatched = updater.stats().unmatched;
  CPANDB_LOG_INFO("ratings applied",
                  {IntField("applied", static_cast<int64_t>(stats_.ratings_applied)),
                   IntField("unmatched", static_cast<int64_t>(stats_.ratings_unmatched)),
                   IntField("commits", static_cast<int64_t>(updater.stats().commits))});
}

void EntityMerger::BackfillMeta() {
  if (!catalog_.IsAttached("meta") || !store_.HasTable("meta_distribution", "meta")) {
    CPANDB_LOG_WARN("META distribution data not available, meta/license keep defaults");
    return;
  }

  // read fully first so no statement on the extract is open across commits
  std::vector<MetaRow> rows;
  store_.QueryEach("SELECT release, COALESCE(meta, 0), meta_license FROM meta.meta_distribution WHERE release IS NOT NULL;", {},
                   [&](const db::sql::Row& row) { rows.push_back({row.GetText(0), row.GetInt64(1), row.GetOptionalText(2)}); });

  db::BatchedUpdater updater(store_, "UPDATE distribution SET meta = ?, license = ? WHERE release = ?;", batch_size_);
  for (const auto& row : rows) {
    if (!updater.Apply({row.meta, db::sql::OptionalText(row.license), row.release})) {
      CPANDB_LOG_DEBUG("META data for unknown release", {StringField("release", row.release)});
    }
  }
  updater.Finish();

  stats_.meta_applied   = updater.stats().applied;
  stats_.meta_unmatched = updater.stats().unmatched;
  CPANDB_LOG_INFO("META data applied",
                  {IntField("applied", static_cast<int64_t>(stats_.meta_applied)),
                   IntField("unmatched", static_cast<int64_t>(stats_.meta_unmatched)),
                   IntField("commits", static_cast<int64_t>(updater.stats().commits))});
}

void EntityMerger::BuildModules() {
  store_.Exec(db::sql::CREATE_MODULE);
  stats_.modules = store_.Exec(
      "INSERT INTO module ( module, version, distribution ) "
      "SELECT module, version, distribution FROM ("
      " SELECT"
      "  m.mod_name AS module,"
      "  m.mod_vers AS version,"
      "  d.dist_name AS distribution,"
      "  MAX(m.mod_id) AS source_id"
      " FROM cpan.mods m, cpan.dists d"
      " WHERE d.dist_id = m.dist_id"
      "  AND m.mod_name IS NOT NULL"
      "  AND d.dist_name IN ( SELECT distribution FROM distribution )"
      " GROUP BY m.mod_name"
      ") ORDER BY module;");
  store_.CreateIndex("module", {"version", "distribution"});
}

void EntityMerger::BuildTickets() {
  store_.Exec(db::sql::CREATE_TICKET);
  stats_.tickets = store_.Exec(
      "INSERT INTO ticket "
      "SELECT id, distribution, subject, status, severity, created, updated "
      "FROM t_ticket ORDER BY id;");
  store_.CreateIndex("ticket", {"distribution", "status", "severity"});
}

} // namespace cpandb::pipeline
