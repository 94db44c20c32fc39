#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/store.hpp"

namespace cpandb::pipeline {

/*
  Collapses module-level declarations in t_requires into
  distribution-level edges.

  Each required module is replaced by the distribution that ships it;
  declarations that collapse to the same (distribution, dependency,
  phase) keep the highest core value. Modules no distribution ships
  produce no edge. Self-edges are kept.
*/
class DependencyResolver {
 public:
  struct Stats {
    int64_t dependencies  = 0;
    int64_t self_edges    = 0;
    int64_t requires_rows = 0;
  };

  explicit DependencyResolver(db::Store& store);

  Stats Run();

  void BuildDependencies();

  // final flattened requires table, without the core column
  void BuildRequires();

  // <0, 0 or >0. Compares dotted components numerically, so 1.10 is
  // above 1.9; a missing version sorts lowest.
  static int CompareVersions(const std::optional<std::string>& a, const std::optional<std::string>& b);

 private:
  db::Store& store_;
  Stats      stats_;
};

} // namespace cpandb::pipeline
