#include "generator.hpp"

#include <chrono>
#include <memory>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/dependency_resolver.hpp"
#include "internal/pipeline/entity_merger.hpp"
#include "internal/pipeline/field_cleaner.hpp"
#include "internal/pipeline/metrics_stage.hpp"
#include "internal/pipeline/normalizer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cpandb::pipeline {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kIntermediateTables[] = {"t_requires", "t_distribution", "t_uploaded", "t_testers", "t_ticket"};

} // namespace

Generator::Generator(GeneratorOptions options, source::SourceCatalog catalog)
    : options_(std::move(options)), catalog_(std::move(catalog)) {
}

template <typename Fn>
void Generator::RunStage(const char* name, Fn&& fn) {
  const auto start = std::chrono::steady_clock::now();
  CPANDB_LOG_INFO("stage started", {StringField("stage", name)});
  try {
    fn();
  } catch (const util::StageFailure&) {
    throw;
  } catch (const std::exception& e) {
    CPANDB_LOG_ERROR("stage failed", {StringField("stage", name), StringField("error", e.what())});
    throw util::StageFailure(name, e.what());
  }
  CPANDB_LOG_INFO("stage finished",
                  {StringField("stage", name), IntField("elapsed_ms", static_cast<int64_t>(util::ElapsedMillis(start)))});
}

void Generator::PrepareOutput() {
  const auto& output = options_.output;
  if (output.empty()) {
    throw util::StoreError("no output path configured");
  }

  std::error_code ec;
  const auto      dir = output.has_parent_path() ? output.parent_path() : std::filesystem::path(".");
  std::filesystem::create_directories(dir, ec);
  if (ec || !std::filesystem::is_directory(dir)) {
    throw util::StoreError("failed to create '" + dir.string() + "': " + ec.message());
  }

  // a rebuild always starts from an empty file
  for (const char* suffix : {"", "-journal", "-wal", "-shm"}) {
    auto path = output;
    path += suffix;
    std::filesystem::remove(path, ec);
    if (std::filesystem::exists(path)) {
      throw util::StoreError("failed to clear '" + path.string() + "'");
    }
  }
}

RunSummary Generator::Run() {
  RunSummary                 summary;
  std::unique_ptr<db::Store> store;

  RunStage("prepare", [&] {
    catalog_.Verify();
    PrepareOutput();
    store = db::Store::Open(options_.output.string(), options_.store);
  });

  RunStage("attach", [&] {
    catalog_.ReportAges();
    catalog_.AttachAll(*store);
  });

  RunStage("normalize", [&] {
    const auto stats = Normalizer(*store, catalog_).Run();
    CPANDB_LOG_INFO("normalized extracts",
                    {IntField("distributions", stats.distributions), IntField("testers", stats.testers),
                     IntField("uploads", stats.uploads), IntField("tickets", stats.tickets),
                     IntField("requires", stats.requires_rows)});
  });

  RunStage("clean", [&] { FieldCleaner(*store).Run(); });

  RunStage("merge", [&] {
    const auto stats      = EntityMerger(*store, catalog_, options_.batch_size).Run();
    summary.authors       = stats.authors;
    summary.distributions = stats.distributions;
    summary.modules       = stats.modules;
    summary.tickets       = stats.tickets;
  });

  RunStage("resolve", [&] {
    const auto stats      = DependencyResolver(*store).Run();
    summary.dependencies  = stats.dependencies;
    summary.requires_rows = stats.requires_rows;
  });

  RunStage("metrics", [&] {
    const auto stats = MetricsStage(*store, graph::MetricsEngine(options_.metrics), options_.batch_size).Run();
    if (stats.dangling_edges > 0) {
      CPANDB_LOG_WARN("dependency edges outside the distribution table",
                      {IntField("edges", static_cast<int64_t>(stats.dangling_edges))});
    }
  });

  RunStage("finalize", [&] { Finalize(*store, summary); });

  CPANDB_LOG_INFO("index generated",
                  {StringField("path", options_.output.string()), IntField("distributions", summary.distributions),
                   IntField("modules", summary.modules), IntField("dependencies", summary.dependencies)});
  return summary;
}

void Generator::Finalize(db::Store& store, RunSummary& summary) {
  store.CreateIndex("distribution", {"version", "author", "meta", "license", "pass", "fail", "unknown", "na", "uploaded",
                                     "rating", "ratings", "weight", "volatility"});

  summary.with_uploaded = store.Count("distribution", "uploaded IS NOT NULL");
  summary.with_meta     = store.Count("distribution", "meta = 1");
  summary.with_rating   = store.Count("distribution", "rating IS NOT NULL");
  CPANDB_LOG_INFO("merge coverage",
                  {IntField("uploaded", summary.with_uploaded), IntField("meta", summary.with_meta),
                   IntField("rating", summary.with_rating), IntField("of", summary.distributions)});

  CPANDB_LOG_INFO("finalizing",
                  {StringField("path", store.Path()), BoolField("keep_intermediate", options_.keep_intermediate),
                   BoolField("vacuum", options_.vacuum), BoolField("analyze", options_.analyze)});

  if (!options_.keep_intermediate) {
    for (const char* table : kIntermediateTables) {
      store.DropTable(table);
    }
  }

  catalog_.DetachAll(store);

  if (options_.vacuum) {
    store.Vacuum();
  }
  if (options_.analyze) {
    store.Analyze("main");
  }
}

} // namespace cpandb::pipeline
