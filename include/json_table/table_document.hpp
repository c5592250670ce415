#pragma once
#include <string>
#include <vector>

#include "json_table/diagnostics.hpp"
#include "json_table/metrics.hpp"
#include "json_table/table_converter.hpp"
#include "json_table/table_matrix.hpp"

namespace jt {

// Everything a renderer needs for one converted (or failed) source.
struct TableDocument {
  std::string title;
  std::string source;            // file path or "<inline>"
  bool include_header = false;
  TableMatrix table;
  std::vector<Diagnostic> notes; // row limit diagnostics, loader warnings
  std::string error;             // non-empty -> error block, no table
  ConversionStats conversion;
};

class TableJsonWriter {
public:
  // Serialize table + run metadata (table.json).
  static std::string to_json(const TableDocument& doc, const RunStats& stats);
};

}
