#include "json_table/row_limit.hpp"
#include <string>

namespace jt {

std::string format_count(std::size_t n) {
  std::string digits = std::to_string(n);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3);
  const std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (i % 3) == lead) out.push_back(',');
    out.push_back(digits[i]);
  }
  return out;
}

RowLimitDecision resolve_row_limit(std::size_t estimated_size,
                                   std::optional<std::size_t> user_limit,
                                   std::size_t default_cap) {
  RowLimitDecision d;

  // explicit override: everything
  if (user_limit && *user_limit == 0) {
    d.limit = RowLimit::unlimited();
    d.diagnostic = Diagnostic{DiagLevel::Info, "Unlimited rows requested via limit 0"};
    return d;
  }

  if (user_limit) {
    d.limit = RowLimit::at_most(*user_limit);
    return d;
  }

  if (estimated_size > default_cap) {
    d.limit = RowLimit::at_most(default_cap);
    d.diagnostic = Diagnostic{
        DiagLevel::Warning,
        "Large dataset detected (" + format_count(estimated_size) + " rows). "
        "Showing first " + format_count(default_cap) + " rows for performance. "
        "Use --limit=0 to show all rows."};
    return d;
  }

  d.limit = RowLimit::unlimited();
  return d;
}

}
