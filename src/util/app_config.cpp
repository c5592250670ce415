#include "json_table/app_config.hpp"

#include <simdjson.h>
#include <charconv>
#include <cstdint>
#include <utility>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jt {

static constexpr int kMaxSmallInt = 65535;

static bool set_err(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
  return false;
}

static bool read_size(simdjson::ondemand::value v, std::string_view key,
                      std::size_t& out, std::string& why) {
  std::uint64_t n = 0;
  if (v.get_uint64().get(n)) {
    why = std::string(key) + " must be a non-negative integer";
    return false;
  }
  out = static_cast<std::size_t>(n);
  return true;
}

static bool read_int(simdjson::ondemand::value v, std::string_view key,
                     int& out, std::string& why) {
  std::int64_t n = 0;
  if (v.get_int64().get(n) || n < 0 || n > kMaxSmallInt) {
    why = std::string(key) + " must be an integer in [0, " + std::to_string(kMaxSmallInt) + "]";
    return false;
  }
  out = static_cast<int>(n);
  return true;
}

static bool read_string(simdjson::ondemand::value v, std::string_view key,
                        std::string& out, std::string& why) {
  std::string_view s;
  if (v.get_string().get(s)) {
    why = std::string(key) + " must be a string";
    return false;
  }
  out.assign(s.data(), s.size());
  return true;
}

bool load_config_file(const std::string& path, AppConfig& cfg, std::string* err) {
  simdjson::padded_string json;
  if (auto e = simdjson::padded_string::load(path).get(json)) {
    return set_err(err, "cannot read config " + path + ": " + simdjson::error_message(e));
  }

  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  if (auto e = parser.iterate(json).get(doc)) {
    return set_err(err, path + ": " + simdjson::error_message(e));
  }
  simdjson::ondemand::object obj;
  if (doc.get_object().get(obj)) {
    return set_err(err, path + ": config must be a JSON object");
  }

  AppConfig next = cfg;
  std::string why;
  for (auto field : obj) {
    std::string_view key;
    if (auto e = field.unescaped_key().get(key)) {
      return set_err(err, path + ": " + simdjson::error_message(e));
    }
    simdjson::ondemand::value v;
    if (auto e = field.value().get(v)) {
      return set_err(err, path + ": " + simdjson::error_message(e));
    }

    bool ok = true;
    if      (key == "default_cap")     ok = read_size(v, key, next.convert.default_cap, why);
    else if (key == "max_objects")     ok = read_size(v, key, next.convert.max_objects, why);
    else if (key == "max_keys")        ok = read_size(v, key, next.convert.max_keys, why);
    else if (key == "max_key_length")  ok = read_size(v, key, next.convert.max_key_length, why);
    else if (key == "skip_empty_keys") {
      bool b = true;
      if (v.get_bool().get(b)) { why = "skip_empty_keys must be a boolean"; ok = false; }
      else next.convert.skip_empty_keys = b;
    }
    else if (key == "artifact_root")   ok = read_string(v, key, next.artifact_root, why);
    else if (key == "slug_mode")       ok = read_string(v, key, next.slug_mode, why);
    else if (key == "slug_len")        ok = read_int(v, key, next.slug_len, why);
    else if (key == "template_dir")    ok = read_string(v, key, next.template_dir, why);
    else if (key == "base_dir")        ok = read_string(v, key, next.base_dir, why);
    else if (key == "encoding")        ok = read_string(v, key, next.encoding, why);
    else if (key == "port")            ok = read_int(v, key, next.port, why);
    // anything else: ignored

    if (!ok) return set_err(err, path + ": " + why);
  }

  if (next.slug_mode != "hashprefix" && next.slug_mode != "basename" &&
      next.slug_mode != "keypath") {
    return set_err(err, path + ": unknown slug_mode '" + next.slug_mode + "'");
  }
  try {
    next.convert.validate();
  } catch (const std::invalid_argument& e) {
    return set_err(err, path + ": " + e.what());
  }

  cfg = std::move(next);
  return true;
}

bool parse_count(std::string_view text, std::size_t& out) {
  if (text.empty()) return false;
  std::size_t n = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, n);
  if (ec != std::errc() || ptr != end) return false;
  out = n;
  return true;
}

bool parse_small_int(std::string_view text, int& out) {
  std::size_t n = 0;
  if (!parse_count(text, n) || n > static_cast<std::size_t>(kMaxSmallInt)) return false;
  out = static_cast<int>(n);
  return true;
}

}
