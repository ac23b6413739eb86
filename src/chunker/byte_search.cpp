#include "fast_chunker/byte_search.hpp"
#include <cstring>
#include <string.h>
#if defined(__SSE2__)
  #include <emmintrin.h>
#endif

namespace fc {

namespace {

// Reverse scan for any of the K needles. SSE2 handles 16-byte blocks from the
// back; whatever is left at the front of the buffer goes through the scalar loop.
template <int K>
std::optional<std::size_t> rscan(const char* s, std::size_t n, const char (&needles)[K]) {
  std::size_t i = n;
#if defined(__SSE2__)
  __m128i v[K];
  for (int k = 0; k < K; ++k) v[k] = _mm_set1_epi8(needles[k]);
  while (i >= 16) {
    __m128i block = _mm_loadu_si128(reinterpret_cast<const __m128i*>(s + i - 16));
    int mask = 0;
    for (int k = 0; k < K; ++k) mask |= _mm_movemask_epi8(_mm_cmpeq_epi8(block, v[k]));
    if (mask != 0) {
      // highest set bit = last matching byte in the block
      const int hi = 31 - __builtin_clz(static_cast<unsigned>(mask));
      return i - 16 + static_cast<std::size_t>(hi);
    }
    i -= 16;
  }
#endif
  while (i > 0) {
    --i;
    for (int k = 0; k < K; ++k) if (s[i] == needles[k]) return i;
  }
  return std::nullopt;
}

}

ByteTable make_byte_table(std::string_view bytes) {
  ByteTable t{};
  for (char c : bytes) t[static_cast<unsigned char>(c)] = true;
  return t;
}

std::optional<std::size_t> rfind_byte(const char* s, std::size_t n, char a) {
  if (n == 0) return std::nullopt;
#if defined(__GLIBC__)
  const void* p = ::memrchr(s, static_cast<unsigned char>(a), n);
  if (!p) return std::nullopt;
  return static_cast<std::size_t>(static_cast<const char*>(p) - s);
#else
  const char needles[1] = {a};
  return rscan(s, n, needles);
#endif
}

std::optional<std::size_t> rfind_any2(const char* s, std::size_t n, char a, char b) {
  const char needles[2] = {a, b};
  return rscan(s, n, needles);
}

std::optional<std::size_t> rfind_any3(const char* s, std::size_t n, char a, char b, char c) {
  const char needles[3] = {a, b, c};
  return rscan(s, n, needles);
}

std::optional<std::size_t> rfind_in_table(const char* s, std::size_t n, const ByteTable& t) {
  for (std::size_t i = n; i > 0; --i) {
    if (t[static_cast<unsigned char>(s[i - 1])]) return i - 1;
  }
  return std::nullopt;
}

std::optional<std::size_t> rfind_pattern(std::string_view window, std::string_view pattern) {
  const std::size_t m = pattern.size();
  if (m == 0 || m > window.size()) return std::nullopt;
  if (m == 1) return rfind_byte(window.data(), window.size(), pattern[0]);

  // Anchor on the pattern's last byte, then verify the m-1 bytes before it.
  // `end` is the exclusive bound on positions of that last byte.
  const char last = pattern[m - 1];
  std::size_t end = window.size();
  while (end >= m) {
    auto hit = rfind_byte(window.data() + (m - 1), end - (m - 1), last);
    if (!hit) return std::nullopt;
    const std::size_t start = *hit;
    if (std::memcmp(window.data() + start, pattern.data(), m - 1) == 0) return start;
    end = start + m - 1;
  }
  return std::nullopt;
}

}
