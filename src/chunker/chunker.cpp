#include "fast_chunker/chunker.hpp"

namespace fc {

std::size_t default_target_size() noexcept { return kDefaultTargetSize; }
std::string_view default_delimiters() noexcept { return kDefaultDelimiters; }

bool ChunkerConfig::validate(std::string* err_out) const {
  if (target_size == 0) {
    if (err_out) *err_out = "target_size must be > 0";
    return false;
  }
  if (mode == Mode::Pattern && pattern.empty()) {
    if (err_out) *err_out = "pattern must not be empty";
    return false;
  }
  return true;
}

// Repeated delimiter bytes would only cost extra compares; keep first occurrences.
static std::string unique_bytes(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (char c : in) if (out.find(c) == std::string::npos) out.push_back(c);
  return out;
}

Chunker::Chunker(std::string_view text, ChunkerConfig cfg,
                 std::shared_ptr<const std::string> storage)
  : storage_(std::move(storage)), text_(text), cfg_(std::move(cfg)) {
  cfg_.delimiters = unique_bytes(cfg_.delimiters);
}

std::optional<Chunker> Chunker::create(std::string_view text, ChunkerConfig cfg,
                                       std::string* err_out) {
  if (!cfg.validate(err_out)) return std::nullopt;
  return Chunker(text, std::move(cfg), nullptr);
}

std::optional<Chunker> Chunker::create_owned(std::string text, ChunkerConfig cfg,
                                             std::string* err_out) {
  if (!cfg.validate(err_out)) return std::nullopt;
  auto storage = std::make_shared<const std::string>(std::move(text));
  const std::string_view view(*storage);
  return Chunker(view, std::move(cfg), std::move(storage));
}

// In prefix mode a match at window index 0 would produce an empty chunk, so
// both finders search from index 1 there.
std::optional<std::size_t> Chunker::find_last_delimiter(std::string_view window) {
  const std::size_t skip = cfg_.prefix ? 1 : 0;
  if (window.size() <= skip) return std::nullopt;
  const char* s = window.data() + skip;
  const std::size_t n = window.size() - skip;
  const std::string& d = cfg_.delimiters;

  std::optional<std::size_t> hit;
  switch (d.size()) {
    case 0: return std::nullopt;
    case 1: hit = rfind_byte(s, n, d[0]); break;
    case 2: hit = rfind_any2(s, n, d[0], d[1]); break;
    case 3: hit = rfind_any3(s, n, d[0], d[1], d[2]); break;
    default:
      if (!table_) table_ = make_byte_table(d);
      hit = rfind_in_table(s, n, *table_);
      break;
  }
  if (!hit) return std::nullopt;
  return *hit + skip;
}

std::optional<std::size_t> Chunker::find_last_pattern(std::string_view window) const {
  const std::size_t skip = cfg_.prefix ? 1 : 0;
  if (window.size() <= skip) return std::nullopt;
  auto hit = rfind_pattern(window.substr(skip), cfg_.pattern);
  if (!hit) return std::nullopt;

  // Without prefix the last contained occurrence already ends its run.
  std::size_t at = *hit + skip;
  if (cfg_.consecutive && cfg_.prefix) {
    const std::size_t m = cfg_.pattern.size();
    while (at >= m + skip && window.compare(at - m, m, cfg_.pattern) == 0) at -= m;
  }
  return at;
}

// Shared by next() and collect_offsets(): end offset of the chunk starting at pos_.
std::size_t Chunker::next_split() {
  const std::size_t remaining = text_.size() - pos_;
  if (remaining <= cfg_.target_size) return text_.size();

  const std::string_view window = text_.substr(pos_, cfg_.target_size);
  if (cfg_.mode == ChunkerConfig::Mode::Pattern) {
    if (auto at = find_last_pattern(window))
      return pos_ + (cfg_.prefix ? *at : *at + cfg_.pattern.size());
  } else if (auto at = find_last_delimiter(window)) {
    return pos_ + (cfg_.prefix ? *at : *at + 1);
  }

  ++hard_splits_;
  return pos_ + cfg_.target_size;
}

bool Chunker::next(std::string_view& out) {
  if (exhausted()) return false;
  const std::size_t end = next_split();
  out = text_.substr(pos_, end - pos_);
  pos_ = end;
  return true;
}

std::size_t Chunker::for_each_chunk(const ChunkCallback& cb) {
  std::size_t n = 0;
  std::string_view chunk;
  while (next(chunk)) { cb(chunk); ++n; }
  return n;
}

Offsets Chunker::collect_offsets() {
  Offsets out;
  if (exhausted()) return out;
  out.reserve((text_.size() - pos_) / cfg_.target_size + 1);
  while (!exhausted()) {
    const std::size_t end = next_split();
    out.emplace_back(pos_, end);
    pos_ = end;
  }
  return out;
}

void Chunker::reset() noexcept {
  pos_ = 0;
  hard_splits_ = 0;
}

std::optional<Chunker> make_chunker(std::string_view text, std::size_t size,
                                    std::string_view delimiters, bool prefix,
                                    std::string* err_out) {
  ChunkerConfig cfg;
  cfg.target_size = size;
  cfg.delimiters = std::string(delimiters);
  cfg.prefix = prefix;
  return Chunker::create(text, std::move(cfg), err_out);
}

std::optional<Chunker> make_owned_chunker(std::string text, std::size_t size,
                                          std::string_view delimiters, bool prefix,
                                          std::string* err_out) {
  ChunkerConfig cfg;
  cfg.target_size = size;
  cfg.delimiters = std::string(delimiters);
  cfg.prefix = prefix;
  return Chunker::create_owned(std::move(text), std::move(cfg), err_out);
}

std::optional<Chunker> make_pattern_chunker(std::string_view text, std::size_t size,
                                            std::string_view pattern, bool prefix,
                                            std::string* err_out) {
  ChunkerConfig cfg;
  cfg.target_size = size;
  cfg.mode = ChunkerConfig::Mode::Pattern;
  cfg.delimiters.clear();
  cfg.pattern = std::string(pattern);
  cfg.prefix = prefix;
  return Chunker::create(text, std::move(cfg), err_out);
}

std::optional<Offsets> chunk_offsets(std::string_view text, std::size_t size,
                                     std::string_view delimiters, bool prefix,
                                     std::string* err_out) {
  auto c = make_chunker(text, size, delimiters, prefix, err_out);
  if (!c) return std::nullopt;
  return c->collect_offsets();
}

std::optional<Offsets> chunk_offsets_pattern(std::string_view text, std::size_t size,
                                             std::string_view pattern, bool prefix,
                                             std::string* err_out) {
  auto c = make_pattern_chunker(text, size, pattern, prefix, err_out);
  if (!c) return std::nullopt;
  return c->collect_offsets();
}

std::vector<std::size_t> flatten_offsets(const Offsets& offs) {
  std::vector<std::size_t> flat;
  flat.reserve(offs.size() * 2);
  for (const auto& [s, e] : offs) { flat.push_back(s); flat.push_back(e); }
  return flat;
}

}
