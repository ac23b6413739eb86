#pragma once
#include "fast_chunker/chunker.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fc {

enum class EmitMode { Summary, Offsets, Chunks };

struct RunConfig {
  ChunkerConfig chunker;

  EmitMode    emit          = EmitMode::Summary;
  std::string artifact_root = "artifacts/fast-chunker";
  std::string slug_mode     = "hashprefix"; // hashprefix|basename|keypath
  int         slug_len      = 8;
  int         port          = 8080;
  bool        serve_only    = false;
  bool        show_help     = false;

  std::string config_path;          // --config=FILE, if any
  std::vector<std::string> scans;   // explicit file paths
};

// "4096", "4K", "4KiB", "1.5MiB", "2G" (1024-based). Parsed with fast_float.
std::optional<std::size_t> parse_size(std::string_view s);

std::optional<EmitMode> parse_emit(std::string_view s);
std::string_view emit_name(EmitMode m);

// Expands \n \r \t \0 \\ and \xHH; anything else is taken literally.
std::optional<std::string> unescape_bytes(std::string_view s, std::string* err_out = nullptr);

// Applies keys from a JSON object file on top of `cfg`:
//   size (number or size string), delimiters, pattern, prefix, consecutive,
//   emit, artifact_root, slug_mode, slug_len, port
// Unknown keys are ignored with a warning on stderr.
bool load_config_json(const std::string& path, RunConfig& cfg, std::string* err_out = nullptr);

// Defaults <- --config file <- remaining flags.
bool parse_cli(int argc, char** argv, RunConfig& cfg, std::string* err_out = nullptr);

const char* usage();

}
