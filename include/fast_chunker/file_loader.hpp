#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace fc {

// Reads a whole file into memory in fixed-size blocks.
class FileLoader {
public:
  struct Config {
    std::size_t block_bytes    = 512 * 1024;              // 512 KiB per fread
    std::size_t max_file_bytes = std::size_t(4) << 30;    // 4 GiB guard
  };

  explicit FileLoader(std::string path);      // uses default Config{}
  FileLoader(std::string path, Config cfg);   // explicit Config

  // Replaces `out` with the file contents. On failure `out` is left empty and
  // last_error() holds errno (EFBIG when the guard trips).
  bool load(std::string& out);

  int  last_error() const noexcept { return last_errno_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  Config cfg_;
  int last_errno_{0};
  std::uint64_t bytes_{0};
};

}
