#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "json_table/convert_config.hpp"

namespace jt {

// Settings for the json-table executable.
// Precedence: built-in defaults < config file < command line.
struct AppConfig {
  ConvertConfig convert;
  std::string artifact_root = "artifacts/json-table";
  std::string slug_mode = "hashprefix"; // hashprefix|basename|keypath
  int slug_len = 8;
  std::string template_dir;             // empty -> build-time default
  std::string base_dir = ".";
  std::string encoding = "utf-8";
  int port = 8080;
};

// Overlays keys from a JSON object file onto `cfg`. Unknown keys are
// ignored; a key with the wrong type (or a zero cap) fails the whole load
// and leaves `cfg` untouched.
bool load_config_file(const std::string& path, AppConfig& cfg, std::string* err = nullptr);

// Command line numbers. The whole text must be decimal digits; signs,
// trailing characters and overflow are rejected.
bool parse_count(std::string_view text, std::size_t& out);

// parse_count limited to [0, 65535] (ports, slug lengths).
bool parse_small_int(std::string_view text, int& out);

}
