#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace cpandb::source {

/*
  Optional capability: how stale an extract is.

  Chosen per source when the catalog is composed. Sources that cannot
  tell use NoSourceAge and are reported as "not implemented".
*/
class SourceAge {
 public:
  virtual ~SourceAge() = default;

  virtual std::optional<int64_t> AgeDays(const std::filesystem::path& path) const = 0;
};

class NoSourceAge final : public SourceAge {
 public:
  std::optional<int64_t> AgeDays(const std::filesystem::path&) const override {
    return std::nullopt;
  }
};

// Age from the extract file's last write time.
class FileModifiedAge final : public SourceAge {
 public:
  std::optional<int64_t> AgeDays(const std::filesystem::path& path) const override;
};

} // namespace cpandb::source
