#include "json_table/table_document.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace jt {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void row_json(std::ostringstream& o, const Row& row) {
  o << "[";
  for (size_t i=0;i<row.size();++i){
    if (i) o << ",";
    esc(o, row[i]);
  }
  o << "]";
}

std::string TableJsonWriter::to_json(const TableDocument& doc, const RunStats& stats) {
  const auto& conv = doc.conversion;

  std::ostringstream o;
  o << "{";
  o << "\"title\":";  esc(o, doc.title);  o << ",";
  o << "\"source\":"; esc(o, doc.source); o << ",";
  o << "\"ok\":" << (doc.error.empty() ? "true" : "false") << ",";
  o << "\"error\":";  esc(o, doc.error);  o << ",";

  // header row is split out so consumers never guess
  const bool split_header = doc.include_header && !doc.table.empty();
  o << "\"header\":";
  if (split_header) row_json(o, doc.table.front()); else o << "null";
  o << ",";

  o << "\"rows\":[";
  for (size_t i = split_header ? 1 : 0, n = 0; i < doc.table.size(); ++i, ++n){
    if (n) o << ",";
    row_json(o, doc.table[i]);
  }
  o << "],";

  o << "\"mode\":"; esc(o, std::string(to_string(conv.mode))); o << ",";
  o << "\"source_rows\":" << conv.source_rows << ",";
  o << "\"emitted_rows\":" << conv.emitted_rows << ",";
  o << "\"truncated\":" << (conv.truncated ? "true" : "false") << ",";
  o << "\"row_limit\":";
  if (conv.limit.cap) o << *conv.limit.cap; else o << "null";
  o << ",";

  o << "\"notes\":[";
  for (size_t i=0;i<doc.notes.size();++i){
    if (i) o << ",";
    o << "{\"level\":"; esc(o, std::string(to_string(doc.notes[i].level)));
    o << ",\"message\":"; esc(o, doc.notes[i].message); o << "}";
  }
  o << "],";

  o << "\"bytes\":" << stats.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(stats.wall_time_ms) << ",";
  o << "\"rows_per_sec\":" << safe_num(stats.rows_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<stats.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, stats.stages[i].name);
    o << ",\"duration_us\":" << stats.stages[i].duration_us << "}";
  }
  o << "],";

  o << "\"skips_by_reason\":{";
  bool first=true;
  for (auto& kv : stats.skips_by_reason) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "}";

  o << "}";
  return o.str();
}

}
