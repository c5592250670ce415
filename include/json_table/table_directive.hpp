#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "json_table/convert_config.hpp"
#include "json_table/diagnostics.hpp"
#include "json_table/metrics.hpp"
#include "json_table/table_converter.hpp"
#include "json_table/table_matrix.hpp"

namespace jt {

struct DirectiveOptions {
  std::optional<std::string> file;    // relative to base_dir
  std::optional<std::string> content; // inline JSON, used when no file
  bool header = false;
  std::string encoding = "utf-8";
  std::optional<std::size_t> limit;   // 0 = unlimited
};

struct DirectiveResult {
  bool ok = false;
  TableMatrix table;
  bool include_header = false;
  std::string error; // "JsonTable directive error: ..." when !ok
  ConversionStats stats;
  std::vector<Diagnostic> diagnostics;
  std::uint64_t bytes = 0;
};

// load -> convert. Library errors end up in DirectiveResult::error; no
// partial table is returned. Diagnostics are both collected and forwarded
// to `sink`. `metrics` (optional) receives load/convert timings and counts.
DirectiveResult run_directive(const DirectiveOptions& opts,
                              const std::filesystem::path& base_dir,
                              const ConvertConfig& cfg = {},
                              const DiagnosticSink& sink = {},
                              MetricsRegistry* metrics = nullptr);

}
