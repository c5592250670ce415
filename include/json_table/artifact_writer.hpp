#pragma once
#include <string>

#include "json_table/table_document.hpp"

namespace jt {

// Writes:
//   <artifact_root>/<slug>/table.json
//   <artifact_root>/<slug>/table.html (+ co-located CSS)
bool write_table_dir(const std::string& artifact_root,
                     const std::string& slug,
                     const TableDocument& doc,
                     const std::string& table_json_str,
                     const std::string& template_dir = {},
                     std::string* err_out = nullptr);

}
