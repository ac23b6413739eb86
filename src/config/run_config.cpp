#include "fast_chunker/run_config.hpp"

#include <simdjson.h>
#include <fast_float/fast_float.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

namespace fc {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back()))  s.remove_suffix(1);
  return s;
}

static std::optional<int> parse_int(std::string_view s) {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

std::optional<std::size_t> parse_size(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;

  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || !std::isfinite(v) || v < 0.0) return std::nullopt;

  std::string_view unit = trim(std::string_view(ptr, static_cast<size_t>(s.data() + s.size() - ptr)));
  double mult = 1.0;
  if (unit.empty() || ieq(unit, "b"))                                   mult = 1.0;
  else if (ieq(unit, "k") || ieq(unit, "kb") || ieq(unit, "kib"))       mult = 1024.0;
  else if (ieq(unit, "m") || ieq(unit, "mb") || ieq(unit, "mib"))       mult = 1024.0 * 1024.0;
  else if (ieq(unit, "g") || ieq(unit, "gb") || ieq(unit, "gib"))       mult = 1024.0 * 1024.0 * 1024.0;
  else return std::nullopt;

  const double bytes = std::floor(v * mult);
  if (bytes >= static_cast<double>(std::numeric_limits<std::size_t>::max())) return std::nullopt;
  return static_cast<std::size_t>(bytes);
}

std::optional<EmitMode> parse_emit(std::string_view s) {
  if (s == "summary") return EmitMode::Summary;
  if (s == "offsets") return EmitMode::Offsets;
  if (s == "chunks")  return EmitMode::Chunks;
  return std::nullopt;
}

std::string_view emit_name(EmitMode m) {
  switch (m) {
    case EmitMode::Summary: return "summary";
    case EmitMode::Offsets: return "offsets";
    case EmitMode::Chunks:  return "chunks";
  }
  return "summary";
}

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<std::string> unescape_bytes(std::string_view s, std::string* err_out) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c != '\\') { out.push_back(c); continue; }
    if (i + 1 >= s.size()) {
      if (err_out) *err_out = "dangling backslash";
      return std::nullopt;
    }
    char e = s[++i];
    switch (e) {
      case 'n':  out.push_back('\n'); break;
      case 'r':  out.push_back('\r'); break;
      case 't':  out.push_back('\t'); break;
      case '0':  out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      case 'x': {
        int hi = (i + 1 < s.size()) ? hex_val(s[i + 1]) : -1;
        int lo = (i + 2 < s.size()) ? hex_val(s[i + 2]) : -1;
        if (hi < 0 || lo < 0) {
          if (err_out) *err_out = "bad \\x escape";
          return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        break;
      }
      default:
        out.push_back(e);
        break;
    }
  }
  return out;
}

static void set_delimiters(ChunkerConfig& c, std::string bytes) {
  c.mode = ChunkerConfig::Mode::Delimiters;
  c.delimiters = std::move(bytes);
}

static void set_pattern(ChunkerConfig& c, std::string bytes) {
  c.mode = ChunkerConfig::Mode::Pattern;
  c.pattern = std::move(bytes);
}

bool load_config_json(const std::string& path, RunConfig& cfg, std::string* err_out) {
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string json = simdjson::padded_string::load(path);
    simdjson::ondemand::document doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();

    for (auto field : obj) {
      std::string key(std::string_view(field.unescaped_key()));
      simdjson::ondemand::value v = field.value();

      if (key == "size") {
        if (v.type().value() == simdjson::ondemand::json_type::number) {
          cfg.chunker.target_size = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
        } else {
          std::string_view s = v.get_string();
          auto n = parse_size(s);
          if (!n) {
            if (err_out) *err_out = "invalid size: " + std::string(s);
            return false;
          }
          cfg.chunker.target_size = *n;
        }
      } else if (key == "delimiters") {
        set_delimiters(cfg.chunker, std::string(std::string_view(v.get_string())));
      } else if (key == "pattern") {
        set_pattern(cfg.chunker, std::string(std::string_view(v.get_string())));
      } else if (key == "prefix") {
        cfg.chunker.prefix = bool(v.get_bool());
      } else if (key == "consecutive") {
        cfg.chunker.consecutive = bool(v.get_bool());
      } else if (key == "emit") {
        std::string_view s = v.get_string();
        auto m = parse_emit(s);
        if (!m) {
          if (err_out) *err_out = "invalid emit mode: " + std::string(s);
          return false;
        }
        cfg.emit = *m;
      } else if (key == "artifact_root") {
        cfg.artifact_root = std::string(std::string_view(v.get_string()));
      } else if (key == "slug_mode") {
        cfg.slug_mode = std::string(std::string_view(v.get_string()));
      } else if (key == "slug_len") {
        cfg.slug_len = static_cast<int>(std::int64_t(v.get_int64()));
      } else if (key == "port") {
        cfg.port = static_cast<int>(std::int64_t(v.get_int64()));
      } else {
        std::cerr << "[config] ignoring unknown key: " << key << "\n";
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = path + ": " + e.what();
    return false;
  }
  cfg.config_path = path;
  return true;
}

const char* usage() {
  return
    "Usage: fast-chunker [--config=FILE] [--size=N|4KiB|1.5MiB]\n"
    "                    [--delimiters=STR] [--pattern=STR] [--prefix] [--consecutive]\n"
    "                    [--emit=summary|offsets|chunks] [--artifact-root=DIR]\n"
    "                    [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
    "                    [--scan <file>|--scan=<file>] [--serve-only] [--port=N]\n"
    "Escapes \\n \\r \\t \\0 \\\\ \\xHH are accepted in STR.\n";
}

bool parse_cli(int argc, char** argv, RunConfig& c, std::string* err_out) {
  auto fail = [&](std::string msg) {
    if (err_out) *err_out = std::move(msg);
    return false;
  };

  // The config file is the base layer; flags override it whatever their order.
  for (int i = 1; i < argc; ++i) {
    std::string_view a(argv[i]);
    if (a.rfind("--config=", 0) == 0) {
      if (!load_config_json(std::string(a.substr(9)), c, err_out)) return false;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string val;

    if (eat("--config=", &val)) continue;
    if (eat("--size=", &val)) {
      auto n = parse_size(val);
      if (!n) return fail("invalid --size: " + val);
      c.chunker.target_size = *n;
      continue;
    }
    if (eat("--delimiters=", &val)) {
      std::string err;
      auto bytes = unescape_bytes(val, &err);
      if (!bytes) return fail("--delimiters: " + err);
      set_delimiters(c.chunker, std::move(*bytes));
      continue;
    }
    if (eat("--pattern=", &val)) {
      std::string err;
      auto bytes = unescape_bytes(val, &err);
      if (!bytes) return fail("--pattern: " + err);
      set_pattern(c.chunker, std::move(*bytes));
      continue;
    }
    if (eat("--emit=", &val)) {
      auto m = parse_emit(val);
      if (!m) return fail("invalid --emit: " + val);
      c.emit = *m;
      continue;
    }
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat("--slug-len=", &val)) {
      auto n = parse_int(val);
      if (!n) return fail("invalid --slug-len: " + val);
      c.slug_len = *n;
      continue;
    }
    if (eat("--port=", &val)) {
      auto n = parse_int(val);
      if (!n) return fail("invalid --port: " + val);
      c.port = *n;
      continue;
    }
    if (a == "--prefix")      { c.chunker.prefix = true; continue; }
    if (a == "--consecutive") { c.chunker.consecutive = true; continue; }
    if (a == "--serve-only")  { c.serve_only = true; continue; }
    if (a == "--scan" && i + 1 < argc) { c.scans.push_back(argv[++i]); continue; }
    if (eat("--scan=", &val)) { c.scans.push_back(val); continue; }
    if (a == "-h" || a == "--help") { c.show_help = true; continue; }
    return fail("unknown argument: " + a);
  }
  return true;
}

}
