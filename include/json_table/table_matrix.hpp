#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace jt {

using Row = std::vector<std::string>;

// Optional header row (row 0) followed by data rows. Widths may differ
// between rows outside the object variant; padding is a renderer concern.
using TableMatrix = std::vector<Row>;

std::size_t max_width(const TableMatrix& table) noexcept;

}
