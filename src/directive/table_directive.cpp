#include "json_table/table_directive.hpp"
#include "json_table/errors.hpp"
#include "json_table/json_loader.hpp"

#include <stdexcept>
#include <string_view>

namespace jt {

static void record_skips(MetricsRegistry& m, const HeaderScanStats& h) {
  if (h.records_skipped) m.add_skips("non_object_record", h.records_skipped);
  if (h.empty_keys)      m.add_skips("empty_key", h.empty_keys);
  if (h.long_keys)       m.add_skips("key_too_long", h.long_keys);
  if (h.key_cap_reached) m.add_skips("key_cap_reached", 1);
}

DirectiveResult run_directive(const DirectiveOptions& opts,
                              const std::filesystem::path& base_dir,
                              const ConvertConfig& cfg,
                              const DiagnosticSink& sink,
                              MetricsRegistry* metrics) {
  DirectiveResult r;
  r.include_header = opts.header;

  DiagnosticLog log;
  DiagnosticSink tee = [&log, &sink](DiagLevel level, std::string_view msg) {
    log.add(level, msg);
    if (sink) sink(level, msg);
  };

  try {
    JsonLoader loader(JsonLoader::Config{opts.encoding}, tee);
    TableConverter converter(cfg, tee);

    if (metrics) metrics->start_stage("load");
    const JsonValue value = loader.load(opts.file, opts.content, base_dir);
    if (metrics) metrics->end_stage("load");
    r.bytes = loader.bytes_read();

    if (metrics) metrics->start_stage("convert");
    r.table = converter.convert(value, opts.header, opts.limit, &r.stats);
    if (metrics) metrics->end_stage("convert");

    r.ok = true;
  } catch (const JsonTableError& e) {
    r.table.clear();
    r.error = format_error("JsonTable directive error", e);
  } catch (const std::invalid_argument& e) {
    // rejected ConvertConfig
    r.table.clear();
    r.error = format_error("JsonTable directive error", e);
  }

  if (metrics) {
    metrics->add_bytes(r.bytes);
    if (r.ok) {
      metrics->add_rows(r.stats.emitted_rows);
      record_skips(*metrics, r.stats.header);
    }
  }
  r.diagnostics = log.entries();
  return r;
}

}
