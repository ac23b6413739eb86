#include "fast_chunker/run_json.hpp"
#include <simdjson.h>
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace fc {

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if there is none
// (stray continuation, truncated, overlong, surrogate or above U+10FFFF).
static std::size_t utf8_seq_len(std::string_view s, std::size_t i) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  std::size_t n = 0;
  unsigned char lo = 0x80, hi = 0xBF; // allowed range of the second byte
  if (b0 < 0x80) return 1;
  else if (b0 >= 0xC2 && b0 <= 0xDF) n = 2;
  else if (b0 >= 0xE0 && b0 <= 0xEF) { n = 3; if (b0 == 0xE0) lo = 0xA0; if (b0 == 0xED) hi = 0x9F; }
  else if (b0 >= 0xF0 && b0 <= 0xF4) { n = 4; if (b0 == 0xF0) lo = 0x90; if (b0 == 0xF4) hi = 0x8F; }
  else return 0;

  if (i + n > s.size()) return 0;
  const auto b1 = static_cast<unsigned char>(s[i + 1]);
  if (b1 < lo || b1 > hi) return 0;
  for (std::size_t k = 2; k < n; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if (b < 0x80 || b > 0xBF) return 0;
  }
  return n;
}

static void append_u00(std::string& o, unsigned char b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "\\u%04x", b);
  o += buf;
}

std::string json_quote(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 2);
  o += '"';
  const bool valid = simdjson::validate_utf8(s.data(), s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    const auto u = static_cast<unsigned char>(c);
    if (u >= 0x80) {
      const std::size_t n = valid ? 1 : utf8_seq_len(s, i);
      if (n == 0) { append_u00(o, u); continue; }
      o.append(s.data() + i, n);
      i += n - 1;
      continue;
    }
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      default:
        if (u < 0x20) append_u00(o, u);
        else o += c;
        break;
    }
  }
  o += '"';
  return o;
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  const ChunkStats& s = p.stats;
  std::ostringstream o;
  o << "{";
  o << "\"chunks\":" << s.chunks << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"hard_splits\":" << s.hard_splits << ",";
  o << "\"min_chunk\":" << s.min_chunk << ",";
  o << "\"max_chunk\":" << s.max_chunk << ",";
  o << "\"mean_chunk\":" << safe_num(s.mean_chunk) << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"chunks_per_sec\":" << safe_num(s.chunks_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":" << json_quote(s.stages[i].name)
      << ",\"duration_ms\":" << safe_num(s.stages[i].duration_ms) << "}";
  }
  o << "],";

  o << "\"size_histogram\":[";
  for (size_t i=0;i<s.size_histogram.size();++i){
    if (i) o << ",";
    o << "{\"le\":" << s.size_histogram[i].first
      << ",\"count\":" << s.size_histogram[i].second << "}";
  }
  o << "],";

  o << "\"config\":{"
    << "\"target_size\":" << p.target_size << ","
    << "\"mode\":" << json_quote(p.mode) << ","
    << "\"delimiters\":" << json_quote(p.delimiters) << ","
    << "\"pattern\":" << json_quote(p.pattern) << ","
    << "\"prefix\":" << (p.prefix ? "true" : "false") << ","
    << "\"consecutive\":" << (p.consecutive ? "true" : "false") << ","
    << "\"emit\":" << json_quote(p.emit)
    << "},";

  o << "\"filename\":" << json_quote(p.filename) << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
