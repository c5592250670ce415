#pragma once
#include <string>
#include <vector>

#include "json_table/header_extract.hpp"
#include "json_table/json_value.hpp"
#include "json_table/shape.hpp"
#include "json_table/table_matrix.hpp"

namespace jt {

// Canonical cell text. null -> "", strings unquoted, containers as minified JSON.
std::string stringify(const JsonValue& v);

// One row per variant.
Row object_row(const JsonValue& record, const HeaderSet& header);
Row raw_row(const JsonValue& element);
Row scalar_row(const JsonValue& element);

// `header` is required for ObjectRows and ignored otherwise.
TableMatrix materialize(const std::vector<JsonValue>& records,
                        ArrayMode mode,
                        const HeaderSet* header,
                        bool include_header);

}
