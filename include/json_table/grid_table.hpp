#pragma once
#include <cstddef>
#include <string>

#include "json_table/table_matrix.hpp"

namespace jt {

// reStructuredText grid table. Rows are padded to the widest row; with
// `include_header` row 0 is separated by '='. An empty matrix renders a
// single "No data available" cell.
std::string render_grid_table(const TableMatrix& table, bool include_header);

// Terminal columns taken by a UTF-8 string. Independent of the ambient
// locale: wcwidth under a UTF-8 LC_CTYPE, a built-in table otherwise.
std::size_t display_width(const std::string& value);

}
