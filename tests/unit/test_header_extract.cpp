#include "json_table/header_extract.hpp"

#include <simdjson.h>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Array elements of `json` as records; `p` owns the document.
static std::vector<jt::JsonValue> records_of(simdjson::dom::parser& p, const std::string& json) {
  std::vector<jt::JsonValue> out;
  for (jt::JsonValue e : p.parse(json).get_array().value()) out.push_back(e);
  return out;
}

static std::string join(const std::vector<std::string>& v) {
  std::string s;
  for (auto& k : v) { if (!s.empty()) s += ","; s += k; }
  return s;
}

int main() {
  jt::ConvertConfig cfg;

  // --- predicates, one per skip reason
  {
    simdjson::dom::parser p;
    auto recs = records_of(p, R"([{"a":1}, "x", [1], 3, null])");
    check(jt::is_mapping_record(recs[0]), "object is a mapping");
    check(!jt::is_mapping_record(recs[1]), "string is not a mapping");
    check(!jt::is_mapping_record(recs[2]), "array is not a mapping");
    check(!jt::is_mapping_record(recs[4]), "null is not a mapping");
  }
  check(jt::is_nonempty_key("k") && !jt::is_nonempty_key(""), "is_nonempty_key");
  check(jt::within_key_length(std::string(255, 'k'), 255), "255-char key within length");
  check(!jt::within_key_length(std::string(256, 'k'), 255), "256-char key over length");
  {
    // 255 two-byte code points: 510 bytes, still within
    std::string wide;
    for (int i = 0; i < 255; ++i) wide += "\xC3\xA9";
    check(jt::utf8_length(wide) == 255, "utf8_length counts code points");
    check(jt::within_key_length(wide, 255), "length counted in code points");
    check(!jt::within_key_length(wide + "\xC3\xA9", 255), "256 code points over length");
  }
  {
    jt::HeaderSet h;
    check(h.add("a") && !h.add("a") && h.size() == 1, "HeaderSet deduplicates");
    check(jt::below_key_cap(h, 2) && !jt::below_key_cap(h, 1), "below_key_cap");
  }
  {
    // lookups stay valid after growth, move and copy
    jt::HeaderSet h;
    for (int i = 0; i < 500; ++i) h.add("key_with_a_long_enough_name_" + std::to_string(i));
    std::string lookup = "key_with_a_long_enough_name_17";
    check(h.contains(std::string_view(lookup)), "contains after growth");
    jt::HeaderSet moved = std::move(h);
    check(moved.size() == 500 && moved.contains("key_with_a_long_enough_name_499"), "contains after move");
    check(!moved.add("key_with_a_long_enough_name_0"), "duplicate rejected after move");
    jt::HeaderSet copy;
    {
      jt::HeaderSet tmp = moved;
      copy = tmp;
    }
    check(copy.contains("key_with_a_long_enough_name_250") && !copy.contains("x"), "copy outlives its source");
    check(copy.add("x") && copy.keys().back() == "x" && !moved.contains("x"), "copy is independent");
  }

  // --- order: first object's keys, then first-seen
  {
    simdjson::dom::parser p;
    auto recs = records_of(p, R"([{"b":1,"a":2},{"a":3,"c":4},{"d":5,"b":6}])");
    auto h = jt::extract_headers(recs, cfg);
    check(join(h.keys()) == "b,a,c,d", "first-object order then discovery order");
  }
  {
    simdjson::dom::parser p;
    auto recs = records_of(p, R"([{"x":1,"y":2,"z":3},{"x":4,"y":5,"z":6}])");
    auto h1 = jt::extract_headers(recs, cfg);
    auto h2 = jt::extract_headers(recs, cfg);
    check(join(h1.keys()) == "x,y,z", "homogeneous header equals first object key order");
    check(h1.keys() == h2.keys(), "deterministic across runs");
  }

  // --- non-mapping records contribute nothing
  {
    simdjson::dom::parser p;
    auto recs = records_of(p, R"([{"a":1}, "bare", 7, {"b":2}])");
    jt::HeaderScanStats st;
    auto h = jt::extract_headers(recs, cfg, &st);
    check(join(h.keys()) == "a,b", "non-mapping records skipped");
    check(st.records_scanned == 4 && st.records_skipped == 2, "skip counter");
  }

  // --- empty and long keys
  {
    simdjson::dom::parser p;
    const std::string k255(255, 'k'), k256(256, 'L');
    const std::string json = "[{\"\":1,\"" + k255 + "\":2,\"" + k256 + "\":3,\"ok\":4}]";
    auto recs = records_of(p, json);
    jt::HeaderScanStats st;
    auto h = jt::extract_headers(recs, cfg, &st);
    check(h.size() == 2 && h.contains(k255) && h.contains("ok"), "255 kept, 256 and empty dropped");
    check(!h.contains(k256), "256-char key excluded");
    check(st.empty_keys == 1 && st.long_keys == 1, "empty/long counters");

    jt::ConvertConfig keep_empty = cfg;
    keep_empty.skip_empty_keys = false;
    auto h2 = jt::extract_headers(recs, keep_empty);
    check(h2.contains(""), "skip_empty_keys=false keeps the empty key");
  }

  // --- key cap: 2000 single-key objects, distinct keys -> first 1000
  {
    std::string json = "[";
    for (int i = 0; i < 2000; ++i) {
      if (i) json += ",";
      json += "{\"k" + std::to_string(i) + "\":" + std::to_string(i) + "}";
    }
    json += "]";
    simdjson::dom::parser p;
    auto recs = records_of(p, json);
    jt::HeaderScanStats st;
    auto h = jt::extract_headers(recs, cfg, &st);
    check(h.size() == 1000, "never more than 1000 keys (got " + std::to_string(h.size()) + ")");
    check(h.keys().front() == "k0" && h.keys().back() == "k999", "keys beyond the 1000th are dropped");
    check(!h.contains("k1000"), "no rotation past the cap");
    check(st.key_cap_reached, "cap reported");
  }

  // --- max_objects bounds the scan
  {
    simdjson::dom::parser p;
    auto recs = records_of(p, R"([{"a":1},{"b":2},{"c":3}])");
    jt::ConvertConfig small = cfg;
    small.max_objects = 2;
    jt::HeaderScanStats st;
    auto h = jt::extract_headers(recs, small, &st);
    check(join(h.keys()) == "a,b" && st.records_scanned == 2, "max_objects limits the scan");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s)\n"; return 1; }
  std::cout << "[PASS] header extraction\n";
  return 0;
}
