#include "normalizer.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cpandb::pipeline {

using observability::IntField;
using observability::StringField;

Normalizer::Normalizer(db::Store& store, const source::SourceCatalog& catalog) : store_(store), catalog_(catalog) {
}

Normalizer::Stats Normalizer::Run() {
  BuildDistributions();
  BuildTesters();
  BuildUploads();
  BuildTickets();
  BuildRequires();

  Stats stats;
  stats.distributions = store_.Count("t_distribution");
  stats.testers       = store_.Count("t_testers");
  stats.uploads       = store_.Count("t_uploaded");
  stats.tickets       = store_.Count("t_ticket");
  stats.requires_rows = store_.Count("t_requires");
  return stats;
}

bool Normalizer::HasSourceTable(const char* alias, const char* table) const {
  if (!catalog_.IsAttached(alias)) {
    return false;
  }
  if (!store_.HasTable(table, alias)) {
    CPANDB_LOG_WARN("source has no expected table", {StringField("source", alias), StringField("table", table)});
    return false;
  }
  return true;
}

void Normalizer::BuildDistributions() {
  if (!HasSourceTable("cpan", "auths") || !HasSourceTable("cpan", "dists")) {
    throw util::SourceMissing("package index (cpan.auths, cpan.dists) is not available");
  }

  // MAX(dist_id) makes the other columns come from the newest row of each name
  store_.Exec(
      "CREATE TABLE t_distribution AS "
      "SELECT dist, version, dist_version, author, release FROM ("
      " SELECT"
      "  d.dist_name AS dist,"
      "  d.dist_vers AS version,"
      "  d.dist_name || ' ' || d.dist_vers AS dist_version,"
      "  a.cpanid AS author,"
      "  a.cpanid || '/' || d.dist_file AS release,"
      "  MAX(d.dist_id) AS source_id"
      " FROM cpan.auths a, cpan.dists d"
      " WHERE a.auth_id = d.auth_id"
      "  AND a.cpanid IS NOT NULL"
      "  AND d.dist_name IS NOT NULL"
      "  AND d.dist_file IS NOT NULL"
      " GROUP BY d.dist_name"
      ") ORDER BY dist;");

  store_.CreateIndex("t_distribution", {"dist", "version", "dist_version", "author", "release"});
}

void Normalizer::BuildTesters() {
  if (HasSourceTable("testers", "release")) {
    store_.Exec(
        "CREATE TABLE t_testers AS "
        "SELECT"
        " dist || ' ' || version AS dist_version,"
        " SUM(pass) AS pass,"
        " SUM(fail) AS fail,"
        " SUM(na) AS na,"
        " SUM(unknown) AS unknown "
        "FROM testers.release "
        "WHERE dist IS NOT NULL AND version IS NOT NULL "
        "GROUP BY dist, version "
        "ORDER BY dist_version;");
  } else {
    store_.Exec("CREATE TABLE t_testers (dist_version TEXT, pass INTEGER, fail INTEGER, na INTEGER, unknown INTEGER);");
  }

  store_.CreateIndex("t_testers", {"dist_version"});
}

void Normalizer::BuildUploads() {
  if (HasSourceTable("upload", "uploads")) {
    // several dists can claim one file; the shortest name is the canonical one
    store_.Exec(
        "CREATE TABLE t_uploaded AS "
        "SELECT dist_version, release, uploaded FROM ("
        " SELECT"
        "  dist || ' ' || version AS dist_version,"
        "  author || '/' || filename AS release,"
        "  DATE(released, 'unixepoch') AS uploaded,"
        "  MIN(LENGTH(dist)) AS dist_length"
        " FROM upload.uploads"
        " WHERE author IS NOT NULL AND filename IS NOT NULL"
        " GROUP BY author, filename"
        ") ORDER BY release;");
  } else {
    store_.Exec("CREATE TABLE t_uploaded (dist_version TEXT, release TEXT, uploaded TEXT);");
  }

  store_.CreateIndex("t_uploaded", {"release", "dist_version"});
}

void Normalizer::BuildTickets() {
  if (HasSourceTable("rt", "ticket")) {
    store_.Exec(
        "CREATE TABLE t_ticket AS "
        "SELECT id, distribution, subject, status, severity, created, updated FROM ("
        " SELECT"
        "  t.id AS id,"
        "  t.distribution AS distribution,"
        "  COALESCE(t.subject, '') AS subject,"
        "  t.status AS status,"
        "  COALESCE(t.severity, 'normal') AS severity,"
        "  COALESCE(DATE(t.created), t.created, '') AS created,"
        "  COALESCE(DATE(t.updated), t.updated, '') AS updated,"
        "  MAX(t.updated) AS last_updated"
        " FROM rt.ticket AS t"
        " WHERE t.id IS NOT NULL"
        "  AND t.status NOT IN ( 'resolved', 'rejected' )"
        "  AND t.distribution IN ( SELECT dist FROM t_distribution )"
        " GROUP BY t.id"
        ") ORDER BY id;");
  } else {
    store_.Exec(
        "CREATE TABLE t_ticket (id INTEGER, distribution TEXT, subject TEXT, status TEXT, severity TEXT, created TEXT, updated TEXT);");
  }

  store_.CreateIndex("t_ticket", {"id", "distribution", "status", "severity"});
}

void Normalizer::BuildRequires() {
  if (!HasSourceTable("meta", "meta_dependency")) {
    throw util::SourceMissing("dependency declarations (meta.meta_dependency) are not available");
  }

  store_.Exec(db::sql::CREATE_T_REQUIRES);

  const auto inserted = store_.Exec(
      "INSERT INTO t_requires "
      "SELECT"
      " d.dist AS distribution,"
      " m.module AS module,"
      " m.version AS version,"
      " m.phase AS phase,"
      " m.core AS core "
      "FROM t_distribution d, meta.meta_dependency m "
      "WHERE d.release = m.release"
      " AND m.module IS NOT NULL"
      " AND m.phase IS NOT NULL "
      "ORDER BY distribution, phase, core DESC, module;");

  const auto incomplete =
      store_.QueryInt("SELECT COUNT(*) FROM meta.meta_dependency WHERE module IS NULL OR phase IS NULL;").value_or(0);
  if (incomplete > 0) {
    CPANDB_LOG_WARN("skipped dependency declarations without module or phase", {IntField("rows", incomplete)});
  }
  CPANDB_LOG_DEBUG("module-level requires loaded", {IntField("rows", inserted)});

  store_.CreateIndex("t_requires", {"distribution", "module", "version", "phase", "core"});
}

} // namespace cpandb::pipeline
