#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace jt {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// True when `target` resolves to `base` or somewhere below it.
bool is_within(const std::filesystem::path& base,
               const std::filesystem::path& target);

// Slug generation: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// First `len` hex digits of SHA-256(data).
std::string hex_hash_prefix(std::string_view data, int len);

}
