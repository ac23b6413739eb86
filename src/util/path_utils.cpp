#include "fast_chunker/path_utils.hpp"
#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>
#if defined(FC_USE_OPENSSL)
  #include <openssl/sha.h>
#endif

namespace fc {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  const auto parent = p.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  if (len <= 0) return {};
  std::ostringstream o;
  o << std::hex << std::setfill('0');
#ifdef FC_USE_OPENSSL
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  for (unsigned char b : md) o << std::setw(2) << static_cast<unsigned>(b);
#else
  o << std::setw(16) << std::hash<std::string_view>{}(data);
#endif
  std::string s = o.str();
  if (static_cast<int>(s.size()) > len) s.resize(static_cast<std::size_t>(len));
  return s;
}

// Report directories are served over HTTP: keep [A-Za-z0-9._-], map the rest
// to '-', turn runs of two or more dots into '-', and never hand back "" or ".".
static std::string safe_slug(std::string_view in, int len) {
  std::string s;
  s.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    const char c = in[i];
    if (c == '.' && i + 1 < in.size() && in[i + 1] == '.') {
      while (i + 1 < in.size() && in[i + 1] == '.') ++i;
      s.push_back('-');
      continue;
    }
    const auto u = static_cast<unsigned char>(c);
    s.push_back((std::isalnum(u) || c == '.' || c == '_' || c == '-') ? c : '-');
  }
  if (len > 0 && static_cast<int>(s.size()) > len) s.resize(static_cast<std::size_t>(len));
  if (s.empty() || s == ".") s = "input";
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename")
    return safe_slug(std::filesystem::path(std::string(key)).filename().string(), len);
  if (mode == "keypath") {
    std::string_view k = key;
    while (!k.empty() && (k.front() == '/' || k.front() == '\\')) k.remove_prefix(1);
    return safe_slug(k, len);
  }
  return safe_slug(hex_hash_prefix(key, len), len);
}

}
