#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "json_table/diagnostics.hpp"
#include "json_table/json_value.hpp"

namespace jt {

enum class TextEncoding { Utf8, Ascii, Latin1 };

// Maps an encoding name to a supported decoder. Unknown names -> nullopt.
std::optional<TextEncoding> parse_encoding(std::string_view name);

// Re-encodes raw bytes as UTF-8. Throws LoadError on bytes the encoding
// cannot represent (invalid UTF-8, non-ASCII in ascii mode).
std::string decode_to_utf8(std::string_view bytes, TextEncoding enc);

struct JsonLoaderConfig {
  std::string encoding = "utf-8";
};

// Loads JSON from a file under a base directory or from inline text.
// A returned JsonValue stays valid until the next load on the same loader.
class JsonLoader {
public:
  using Config = JsonLoaderConfig;

  // An unsupported encoding logs a warning through `sink` and falls back to UTF-8.
  explicit JsonLoader(Config cfg = {}, DiagnosticSink sink = {});
  ~JsonLoader();
  JsonLoader(const JsonLoader&) = delete;
  JsonLoader& operator=(const JsonLoader&) = delete;

  JsonValue load_from_file(std::string_view relative_path,
                           const std::filesystem::path& base_dir);
  JsonValue load_from_content(std::string_view content);

  // File wins over content; neither -> LoadError.
  JsonValue load(const std::optional<std::string>& file,
                 const std::optional<std::string>& content,
                 const std::filesystem::path& base_dir);

  TextEncoding encoding() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
