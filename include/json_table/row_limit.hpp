#pragma once
#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>

#include "json_table/diagnostics.hpp"

namespace jt {

// Resolved once per conversion: a positive cap, or unlimited.
struct RowLimit {
  std::optional<std::size_t> cap; // nullopt -> unlimited

  static RowLimit unlimited() { return RowLimit{}; }
  static RowLimit at_most(std::size_t n) { return RowLimit{n}; }

  bool is_unlimited() const noexcept { return !cap.has_value(); }

  // Number of rows to materialize out of `available`.
  std::size_t apply(std::size_t available) const noexcept {
    return cap ? std::min(*cap, available) : available;
  }
};

struct RowLimitDecision {
  RowLimit limit;
  std::optional<Diagnostic> diagnostic; // at most one per call
};

// user_limit: nullopt (use default cap), 0 (unlimited) or a positive count,
// kept verbatim even when it exceeds estimated_size.
// Capping triggers only when estimated_size > default_cap.
RowLimitDecision resolve_row_limit(std::size_t estimated_size,
                                   std::optional<std::size_t> user_limit,
                                   std::size_t default_cap);

// 12345 -> "12,345"
std::string format_count(std::size_t n);

}
