#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace fc {

// mkdir -p for the parent of `p`.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Report directory name for an input key:
//   "hashprefix" (default)  hex digest prefix of the key
//   "basename"              file name of the key
//   "keypath"               whole key with separators replaced
// Result is at most `len` characters of [A-Za-z0-9._-].
std::string make_slug(std::string_view key, std::string_view mode, int len);

// SHA-256 with FC_USE_OPENSSL, std::hash otherwise.
std::string hex_hash_prefix(std::string_view data, int len);

}
