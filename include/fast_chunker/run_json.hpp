#pragma once
#include "fast_chunker/metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fc {

struct RunJsonPayload {
  // Chunking results
  ChunkStats stats;
  double wall_time_ms = 0.0;

  // Chunker configuration used for the run
  std::size_t target_size = 0;
  std::string mode;          // "delimiters" | "pattern"
  std::string delimiters;
  std::string pattern;
  bool prefix = false;
  bool consecutive = false;
  std::string emit = "summary"; // summary | offsets | chunks

  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
};

// JSON string literal for arbitrary bytes. Well-formed UTF-8 is copied as is;
// control bytes and every byte that is not part of a well-formed UTF-8
// sequence are written as \u00XX. Non-ASCII characters are never escaped, so a
// \u0080..\u00ff escape in the output always stands for one raw byte.
std::string json_quote(std::string_view s);

}
