#pragma once
#include <cstddef>
#include <optional>

#include "json_table/convert_config.hpp"
#include "json_table/diagnostics.hpp"
#include "json_table/header_extract.hpp"
#include "json_table/json_value.hpp"
#include "json_table/row_limit.hpp"
#include "json_table/shape.hpp"
#include "json_table/table_matrix.hpp"

namespace jt {

struct ConversionStats {
  ArrayMode mode = ArrayMode::ObjectRows;
  std::size_t source_rows = 0;  // estimated dataset size
  std::size_t emitted_rows = 0; // data rows, header excluded
  bool truncated = false;
  RowLimit limit;
  HeaderScanStats header;
};

// JSON value -> string matrix. Pure apart from the diagnostic sink, which is
// invoked at most once per call. Throws EmptyDataError / InvalidShapeError.
class TableConverter {
public:
  explicit TableConverter(ConvertConfig cfg = {}, DiagnosticSink sink = {});

  TableMatrix convert(const JsonValue& value,
                      bool include_header,
                      std::optional<std::size_t> limit,
                      ConversionStats* stats = nullptr) const;

  const ConvertConfig& config() const noexcept { return cfg_; }

private:
  ConvertConfig cfg_;
  DiagnosticSink sink_;
};

TableMatrix convert(const JsonValue& value,
                    bool include_header,
                    std::optional<std::size_t> limit,
                    const ConvertConfig& cfg,
                    const DiagnosticSink& sink);

}
