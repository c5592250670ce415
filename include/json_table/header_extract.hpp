#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "json_table/convert_config.hpp"
#include "json_table/json_value.hpp"

namespace jt {

// Ordered, deduplicated column names for one conversion call.
class HeaderSet {
public:
  HeaderSet() = default;
  HeaderSet(const HeaderSet& other);
  HeaderSet& operator=(const HeaderSet& other);
  HeaderSet(HeaderSet&&) = default;
  HeaderSet& operator=(HeaderSet&&) = default;

  // Appends `key` unless already present; returns true when appended.
  bool add(std::string_view key);
  bool contains(std::string_view key) const;

  std::size_t size() const noexcept { return keys_.size(); }
  bool empty() const noexcept { return keys_.empty(); }
  const std::vector<std::string>& keys() const noexcept { return keys_; }

private:
  std::vector<std::string> keys_;
  // seen_ views the strings in store_; deque elements never move.
  std::deque<std::string> store_;
  std::unordered_set<std::string_view> seen_;
};

struct HeaderScanStats {
  std::size_t records_scanned = 0;
  std::size_t records_skipped = 0; // not a mapping
  std::size_t empty_keys      = 0;
  std::size_t long_keys       = 0;
  bool        key_cap_reached = false;
};

// Skip predicates, one per reason.
bool is_mapping_record(const JsonValue& record) noexcept;
bool is_nonempty_key(std::string_view key) noexcept;
bool within_key_length(std::string_view key, std::size_t max_key_length) noexcept;
bool below_key_cap(const HeaderSet& header, std::size_t max_keys) noexcept;

// Code points in a UTF-8 string.
std::size_t utf8_length(std::string_view s) noexcept;

// Scans at most cfg.max_objects records. Header order is the first record's
// key order, then newly seen keys in first-seen order.
HeaderSet extract_headers(const std::vector<JsonValue>& records,
                          const ConvertConfig& cfg,
                          HeaderScanStats* stats = nullptr);

}
