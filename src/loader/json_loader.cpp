#include "json_table/json_loader.hpp"
#include "json_table/errors.hpp"
#include "json_table/path_utils.hpp"

#include <simdjson.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace jt {

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::optional<TextEncoding> parse_encoding(std::string_view name) {
  const std::string n = lower(name);
  if (n == "utf-8" || n == "utf8" || n == "utf-8-sig") return TextEncoding::Utf8;
  if (n == "ascii" || n == "us-ascii")                  return TextEncoding::Ascii;
  if (n == "latin-1" || n == "latin1" || n == "iso-8859-1") return TextEncoding::Latin1;
  return std::nullopt;
}

std::string decode_to_utf8(std::string_view bytes, TextEncoding enc) {
  switch (enc) {
    case TextEncoding::Utf8: {
      if (bytes.size() >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) bytes.remove_prefix(3);
      if (!simdjson::validate_utf8(bytes.data(), bytes.size()))
        throw LoadError("input is not valid utf-8");
      return std::string(bytes);
    }
    case TextEncoding::Ascii: {
      auto bad = std::find_if(bytes.begin(), bytes.end(),
                              [](char c){ return static_cast<unsigned char>(c) >= 0x80; });
      if (bad != bytes.end())
        throw LoadError("non-ascii byte at offset " + std::to_string(bad - bytes.begin()));
      return std::string(bytes);
    }
    case TextEncoding::Latin1: {
      std::string out;
      out.reserve(bytes.size() + bytes.size() / 4);
      for (unsigned char c : bytes) {
        if (c < 0x80) { out.push_back(static_cast<char>(c)); continue; }
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
      }
      return out;
    }
  }
  return std::string(bytes);
}

struct JsonLoader::Impl {
  TextEncoding enc = TextEncoding::Utf8;
  simdjson::dom::parser parser;
  std::uint64_t bytes{0};

  JsonValue parse(std::string_view raw, const std::string& context) {
    std::string text;
    try {
      text = decode_to_utf8(raw, enc);
    } catch (const LoadError& e) {
      throw LoadError(format_error(context, e));
    }
    JsonValue doc;
    auto err = parser.parse(text).get(doc);
    if (err) throw LoadError(context + ": " + simdjson::error_message(err));
    return doc;
  }
};

JsonLoader::JsonLoader(Config cfg, DiagnosticSink sink) : p_(new Impl{}) {
  auto enc = parse_encoding(cfg.encoding);
  if (!enc) {
    if (sink) sink(DiagLevel::Warning,
                   "Invalid encoding '" + cfg.encoding + "', falling back to utf-8");
    enc = TextEncoding::Utf8;
  }
  p_->enc = *enc;
}

JsonLoader::~JsonLoader() { delete p_; }

TextEncoding JsonLoader::encoding() const noexcept { return p_->enc; }
std::uint64_t JsonLoader::bytes_read() const noexcept { return p_->bytes; }

JsonValue JsonLoader::load_from_file(std::string_view relative_path,
                                     const std::filesystem::path& base_dir) {
  const std::filesystem::path target = base_dir / std::string(relative_path);
  if (!is_within(base_dir, target)) {
    throw LoadError("Path '" + std::string(relative_path) +
                    "' is not safe (directory traversal detected)");
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(target, ec)) {
    throw LoadError("JSON file not found: " + target.string());
  }

  std::ifstream in(target, std::ios::binary);
  if (!in) throw LoadError("Failed to load JSON file: cannot open " + target.string());
  std::ostringstream ss; ss << in.rdbuf();
  const std::string raw = ss.str();
  p_->bytes += raw.size();

  return p_->parse(raw, "Failed to load " + std::string(relative_path));
}

JsonValue JsonLoader::load_from_content(std::string_view content) {
  const bool blank = std::all_of(content.begin(), content.end(),
                                 [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; });
  if (blank) throw LoadError("No inline JSON content provided");
  p_->bytes += content.size();
  return p_->parse(content, "Failed to parse inline JSON");
}

JsonValue JsonLoader::load(const std::optional<std::string>& file,
                           const std::optional<std::string>& content,
                           const std::filesystem::path& base_dir) {
  if (file && !file->empty()) return load_from_file(*file, base_dir);
  if (content && !content->empty()) return load_from_content(*content);
  throw LoadError("No JSON data source provided");
}

}
