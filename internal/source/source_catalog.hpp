#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/store.hpp"
#include "source_age.hpp"

namespace cpandb::source {

enum class SourceKind {
  Database, // sqlite file, attached to the store under its alias
  Csv,      // read directly by the stage that consumes it
};

struct ExtractSource {
  // schema alias for databases, display name otherwise
  std::string                      alias;
  SourceKind                       kind = SourceKind::Database;
  std::filesystem::path            path;
  bool                             required = false;
  std::shared_ptr<const SourceAge> age      = std::make_shared<NoSourceAge>();
};

/*
  The raw extracts one run consumes.

  Acquisition happens before the run; the catalog only checks presence,
  reports age and attaches database extracts. A missing required extract
  throws util::SourceMissing; a missing optional one is logged and the
  stages that use it degrade to nulls.
*/
class SourceCatalog {
 public:
  void Add(ExtractSource source);

  // Throws util::SourceMissing for the first required source that is absent.
  void Verify() const;

  void ReportAges() const;

  void AttachAll(db::Store& store);
  void DetachAll(db::Store& store);

  bool IsAvailable(const std::string& alias) const;
  bool IsAttached(const std::string& alias) const;

  // nullptr when no source with that alias was configured
  const ExtractSource* Find(const std::string& alias) const;

 private:
  std::vector<ExtractSource> sources_;
  std::vector<std::string>   attached_;
};

} // namespace cpandb::source
