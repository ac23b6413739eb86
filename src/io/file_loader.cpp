#include "fast_chunker/file_loader.hpp"
#include <cerrno>
#include <cstdio>
#include <vector>

namespace fc {

FileLoader::FileLoader(std::string path)
  : FileLoader(std::move(path), Config{}) {}

FileLoader::FileLoader(std::string path, Config cfg)
  : path_(std::move(path)), cfg_(cfg) {
  if (cfg_.block_bytes == 0) cfg_.block_bytes = Config{}.block_bytes;
}

bool FileLoader::load(std::string& out) {
  out.clear();
  bytes_ = 0;
  last_errno_ = 0;

  FILE* f = std::fopen(path_.c_str(), "rb");
  if (!f) { last_errno_ = errno; return false; }

  // Size hint only; the read loop below is authoritative.
  if (std::fseek(f, 0, SEEK_END) == 0) {
    long end = std::ftell(f);
    if (end > 0 && static_cast<std::size_t>(end) <= cfg_.max_file_bytes)
      out.reserve(static_cast<std::size_t>(end));
    std::rewind(f);
  }

  std::vector<char> buf(cfg_.block_bytes);
  while (true) {
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0 && std::ferror(f)) {
      last_errno_ = errno;
      std::fclose(f);
      out.clear();
      return false;
    }
    if (n == 0) break;
    if (out.size() + n > cfg_.max_file_bytes) {
      last_errno_ = EFBIG;
      std::fclose(f);
      out.clear();
      return false;
    }
    out.append(buf.data(), n);
    bytes_ += n;
  }

  std::fclose(f);
  return true;
}

}
