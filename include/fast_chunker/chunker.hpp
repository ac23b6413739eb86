#pragma once
#include "fast_chunker/byte_search.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fc {

inline constexpr std::size_t      kDefaultTargetSize = 4096;
inline constexpr std::string_view kDefaultDelimiters = "\n.?";

std::size_t      default_target_size() noexcept;
std::string_view default_delimiters() noexcept;

// (start, end) byte offsets of each chunk, end exclusive.
using Offsets = std::vector<std::pair<std::size_t, std::size_t>>;

struct ChunkerConfig {
  enum class Mode { Delimiters, Pattern };

  std::size_t target_size = kDefaultTargetSize;
  Mode        mode        = Mode::Delimiters;
  std::string delimiters  = std::string(kDefaultDelimiters); // Mode::Delimiters
  std::string pattern;                                        // Mode::Pattern
  bool        prefix      = false; // match opens the next chunk instead of closing this one
  bool        consecutive = false; // Mode::Pattern + prefix: cut before a whole run of repeats

  // Fills err_out and returns false for a zero target size or an empty pattern.
  bool validate(std::string* err_out = nullptr) const;
};

// Splits a byte buffer into chunks of at most `target_size` bytes, cutting
// after the last delimiter (or pattern) inside each window when there is one.
//
// Borrowed instances view caller memory that must outlive every chunk handed
// out. Owned instances keep an immutable copy shared between engine copies.
// An instance is not safe for concurrent use.
class Chunker {
public:
  using ChunkCallback = std::function<void(std::string_view)>;

  static std::optional<Chunker> create(std::string_view text, ChunkerConfig cfg,
                                       std::string* err_out = nullptr);
  static std::optional<Chunker> create_owned(std::string text, ChunkerConfig cfg,
                                             std::string* err_out = nullptr);

  // Next chunk as a view into the buffer; false once exhausted.
  bool next(std::string_view& out);

  // Drains remaining chunks through `cb`; returns the number emitted.
  std::size_t for_each_chunk(const ChunkCallback& cb);

  // Drains remaining chunks as offsets only.
  Offsets collect_offsets();

  // Rewinds to offset 0. Configuration and lookup table are kept.
  void reset() noexcept;

  bool exhausted() const noexcept { return pos_ >= text_.size(); }
  std::size_t position() const noexcept { return pos_; }
  std::size_t size() const noexcept { return text_.size(); }
  std::uint64_t hard_splits() const noexcept { return hard_splits_; }
  std::string_view text() const noexcept { return text_; }
  const ChunkerConfig& config() const noexcept { return cfg_; }

private:
  Chunker(std::string_view text, ChunkerConfig cfg,
          std::shared_ptr<const std::string> storage);

  std::size_t next_split();
  std::optional<std::size_t> find_last_delimiter(std::string_view window);
  std::optional<std::size_t> find_last_pattern(std::string_view window) const;

  std::shared_ptr<const std::string> storage_; // null when borrowed
  std::string_view text_;
  ChunkerConfig cfg_;
  std::size_t pos_{0};
  std::uint64_t hard_splits_{0};
  std::optional<ByteTable> table_;
};

// Single-byte delimiter mode.
std::optional<Chunker> make_chunker(std::string_view text,
                                    std::size_t size = kDefaultTargetSize,
                                    std::string_view delimiters = kDefaultDelimiters,
                                    bool prefix = false,
                                    std::string* err_out = nullptr);

std::optional<Chunker> make_owned_chunker(std::string text,
                                          std::size_t size = kDefaultTargetSize,
                                          std::string_view delimiters = kDefaultDelimiters,
                                          bool prefix = false,
                                          std::string* err_out = nullptr);

// Pattern mode; fails on an empty pattern.
std::optional<Chunker> make_pattern_chunker(std::string_view text,
                                            std::size_t size,
                                            std::string_view pattern,
                                            bool prefix = false,
                                            std::string* err_out = nullptr);

// One-shot helpers: construct + collect_offsets.
std::optional<Offsets> chunk_offsets(std::string_view text,
                                     std::size_t size = kDefaultTargetSize,
                                     std::string_view delimiters = kDefaultDelimiters,
                                     bool prefix = false,
                                     std::string* err_out = nullptr);

std::optional<Offsets> chunk_offsets_pattern(std::string_view text,
                                             std::size_t size,
                                             std::string_view pattern,
                                             bool prefix = false,
                                             std::string* err_out = nullptr);

// [s0, e0, s1, e1, ...]
std::vector<std::size_t> flatten_offsets(const Offsets& offs);

}
