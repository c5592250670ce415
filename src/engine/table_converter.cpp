#include "json_table/table_converter.hpp"
#include "json_table/row_materializer.hpp"
#include <utility>
#include <vector>

namespace jt {

static std::vector<JsonValue> take_records(const JsonValue& value,
                                           const Shape& shape,
                                           std::size_t n) {
  std::vector<JsonValue> out;
  if (shape.single_object) {
    if (n > 0) out.push_back(value);
    return out;
  }
  out.reserve(n);
  for (JsonValue e : value.get_array().value_unsafe()) {
    if (out.size() >= n) break;
    out.push_back(e);
  }
  return out;
}

TableConverter::TableConverter(ConvertConfig cfg, DiagnosticSink sink)
  : cfg_(cfg), sink_(std::move(sink)) {
  cfg_.validate();
}

TableMatrix TableConverter::convert(const JsonValue& value,
                                    bool include_header,
                                    std::optional<std::size_t> limit,
                                    ConversionStats* stats) const {
  // (1) shape; throws before anything is emitted
  const Shape shape = classify(value);

  // (2) row limit, fixed for the rest of the call
  const RowLimitDecision decision =
      resolve_row_limit(shape.estimated_size, limit, cfg_.default_cap);
  if (decision.diagnostic && sink_) {
    sink_(decision.diagnostic->level, decision.diagnostic->message);
  }

  const std::size_t take = decision.limit.apply(shape.estimated_size);
  const std::vector<JsonValue> records = take_records(value, shape, take);

  // (3) header (object rows only) + (4) rows
  HeaderScanStats hstats;
  TableMatrix table;
  if (shape.mode == ArrayMode::ObjectRows) {
    const HeaderSet header = extract_headers(records, cfg_, &hstats);
    table = materialize(records, shape.mode, &header, include_header);
  } else {
    table = materialize(records, shape.mode, nullptr, include_header);
  }

  if (stats) {
    stats->mode = shape.mode;
    stats->source_rows = shape.estimated_size;
    stats->emitted_rows = records.size();
    stats->truncated = records.size() < shape.estimated_size;
    stats->limit = decision.limit;
    stats->header = hstats;
  }
  return table;
}

TableMatrix convert(const JsonValue& value,
                    bool include_header,
                    std::optional<std::size_t> limit,
                    const ConvertConfig& cfg,
                    const DiagnosticSink& sink) {
  return TableConverter(cfg, sink).convert(value, include_header, limit);
}

}
