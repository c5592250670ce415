#include "json_table/table_matrix.hpp"
#include <algorithm>

namespace jt {

std::size_t max_width(const TableMatrix& table) noexcept {
  std::size_t w = 0;
  for (const auto& row : table) w = std::max(w, row.size());
  return w;
}

}
