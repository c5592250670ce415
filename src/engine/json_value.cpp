#include "json_table/json_value.hpp"

namespace jt {

std::size_t element_count(simdjson::dom::array arr) noexcept {
  // scope_count is a 24-bit field on the tape
  constexpr std::size_t kSaturated = 0xFFFFFF;
  std::size_t n = arr.size();
  if (n < kSaturated) return n;
  n = 0;
  for (auto it = arr.begin(); it != arr.end(); ++it) ++n;
  return n;
}

}
