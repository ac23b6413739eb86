#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace fc {

// 256-entry byte membership table (one slot per byte value).
using ByteTable = std::array<bool, 256>;

ByteTable make_byte_table(std::string_view bytes);

// Reverse searches over [s, s+n). Each returns the highest matching index.
std::optional<std::size_t> rfind_byte(const char* s, std::size_t n, char a);
std::optional<std::size_t> rfind_any2(const char* s, std::size_t n, char a, char b);
std::optional<std::size_t> rfind_any3(const char* s, std::size_t n, char a, char b, char c);
std::optional<std::size_t> rfind_in_table(const char* s, std::size_t n, const ByteTable& t);

// Start index of the last occurrence of `pattern` lying entirely inside `window`.
std::optional<std::size_t> rfind_pattern(std::string_view window, std::string_view pattern);

}
