#include "json_table/header_extract.hpp"
#include <algorithm>

namespace jt {

HeaderSet::HeaderSet(const HeaderSet& other) {
  for (const auto& k : other.keys_) add(k);
}

HeaderSet& HeaderSet::operator=(const HeaderSet& other) {
  if (this != &other) {
    keys_.clear();
    seen_.clear();
    store_.clear();
    for (const auto& k : other.keys_) add(k);
  }
  return *this;
}

bool HeaderSet::add(std::string_view key) {
  if (seen_.count(key) != 0) return false;
  store_.emplace_back(key);
  seen_.insert(store_.back());
  keys_.emplace_back(key);
  return true;
}

bool HeaderSet::contains(std::string_view key) const {
  return seen_.count(key) != 0;
}

std::size_t utf8_length(std::string_view s) noexcept {
  std::size_t n = 0;
  for (unsigned char c : s) if ((c & 0xC0) != 0x80) ++n; // skip continuation bytes
  return n;
}

bool is_mapping_record(const JsonValue& record) noexcept {
  return record.type() == simdjson::dom::element_type::OBJECT;
}

bool is_nonempty_key(std::string_view key) noexcept { return !key.empty(); }

bool within_key_length(std::string_view key, std::size_t max_key_length) noexcept {
  // cheap reject before counting code points
  if (key.size() <= max_key_length) return true;
  return utf8_length(key) <= max_key_length;
}

bool below_key_cap(const HeaderSet& header, std::size_t max_keys) noexcept {
  return header.size() < max_keys;
}

HeaderSet extract_headers(const std::vector<JsonValue>& records,
                          const ConvertConfig& cfg,
                          HeaderScanStats* stats) {
  HeaderSet header;
  HeaderScanStats st;

  const std::size_t n = std::min(records.size(), cfg.max_objects);
  for (std::size_t i = 0; i < n && !st.key_cap_reached; ++i) {
    const JsonValue& rec = records[i];
    ++st.records_scanned;
    if (!is_mapping_record(rec)) { ++st.records_skipped; continue; }

    for (auto field : rec.get_object().value_unsafe()) {
      if (!below_key_cap(header, cfg.max_keys)) { st.key_cap_reached = true; break; }
      if (cfg.skip_empty_keys && !is_nonempty_key(field.key)) { ++st.empty_keys; continue; }
      if (!within_key_length(field.key, cfg.max_key_length)) { ++st.long_keys; continue; }
      header.add(field.key);
    }
  }
  if (!below_key_cap(header, cfg.max_keys)) st.key_cap_reached = true;

  if (stats) *stats = st;
  return header;
}

}
