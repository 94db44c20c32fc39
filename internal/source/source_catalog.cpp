#include "source_catalog.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cpandb::source {

using observability::IntField;
using observability::StringField;

namespace {

bool FileExists(const std::filesystem::path& path) {
  std::error_code ec;
  return !path.empty() && std::filesystem::is_regular_file(path, ec);
}

} // namespace

void SourceCatalog::Add(ExtractSource source) {
  if (source.kind == SourceKind::Database && !db::IsIdentifier(source.alias)) {
    throw util::ConfigError("invalid source alias '" + source.alias + "'");
  }
  if (Find(source.alias)) {
    throw util::ConfigError("duplicate source '" + source.alias + "'");
  }
  if (!source.age) {
    source.age = std::make_shared<NoSourceAge>();
  }
  sources_.push_back(std::move(source));
}

void SourceCatalog::Verify() const {
  for (const auto& source : sources_) {
    if (FileExists(source.path)) {
      continue;
    }
    if (source.required) {
      throw util::SourceMissing("required source '" + source.alias + "' not found at '" + source.path.string() + "'");
    }
    CPANDB_LOG_WARN("optional source missing, columns will stay null",
                    {StringField("source", source.alias), StringField("path", source.path.string())});
  }
}

void SourceCatalog::ReportAges() const {
  for (const auto& source : sources_) {
    if (!FileExists(source.path)) {
      continue;
    }
    if (auto days = source.age->AgeDays(source.path)) {
      CPANDB_LOG_INFO("source age", {StringField("source", source.alias), IntField("days", *days)});
    } else {
      CPANDB_LOG_INFO("source age", {StringField("source", source.alias), StringField("days", "not implemented")});
    }
  }
}

void SourceCatalog::AttachAll(db::Store& store) {
  for (const auto& source : sources_) {
    if (source.kind != SourceKind::Database || !FileExists(source.path) || IsAttached(source.alias)) {
      continue;
    }
    store.Attach(source.alias, source.path.string());
    attached_.push_back(source.alias);
    CPANDB_LOG_DEBUG("attached source", {StringField("source", source.alias), StringField("path", source.path.string())});
  }
}

void SourceCatalog::DetachAll(db::Store& store) {
  for (const auto& alias : attached_) {
    store.Detach(alias);
  }
  attached_.clear();
}

bool SourceCatalog::IsAvailable(const std::string& alias) const {
  const auto* source = Find(alias);
  return source && FileExists(source->path);
}

bool SourceCatalog::IsAttached(const std::string& alias) const {
  return std::find(attached_.begin(), attached_.end(), alias) != attached_.end();
}

const ExtractSource* SourceCatalog::Find(const std::string& alias) const {
  auto it = std::find_if(sources_.begin(), sources_.end(), [&](const ExtractSource& s) { return s.alias == alias; });
  return it == sources_.end() ? nullptr : &*it;
}

} // namespace cpandb::source
