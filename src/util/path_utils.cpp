#include "json_table/path_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace jt {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool is_within(const std::filesystem::path& base,
               const std::filesystem::path& target) {
  std::error_code ec;
  auto base_canon = std::filesystem::weakly_canonical(base, ec);
  if (ec) return false;
  auto target_canon = std::filesystem::weakly_canonical(target, ec);
  if (ec) return false;

  // trailing "" component of "dir/" would never match
  if (!base_canon.empty() && base_canon.filename().empty()) base_canon = base_canon.parent_path();

  auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(),
                                target_canon.begin(), target_canon.end());
  return mismatch.first == base_canon.end();
}

std::string hex_hash_prefix(std::string_view data, int len) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
    return std::string{};
  }
  std::ostringstream o;
  for (unsigned int i = 0; i < md_len && static_cast<int>(i) < (len + 1) / 2; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  auto s = o.str();
  if (static_cast<int>(s.size()) > len) s.resize(len);
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\') c='-';
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
