#include "fast_chunker/run_config.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { ++failures; std::cerr << "[FAIL] " << what << "\n"; }
}

static bool run_cli(std::vector<std::string> args, fc::RunConfig& cfg, std::string* err) {
  std::vector<char*> argv;
  static char prog[] = "fast-chunker";
  argv.push_back(prog);
  for (auto& a : args) argv.push_back(a.data());
  return fc::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg, err);
}

int main() {
  // Sizes
  expect(fc::parse_size("4096") == std::optional<std::size_t>(4096), "plain bytes");
  expect(fc::parse_size("4K") == std::optional<std::size_t>(4096), "4K");
  expect(fc::parse_size("4 KiB") == std::optional<std::size_t>(4096), "4 KiB");
  expect(fc::parse_size("1.5MiB") == std::optional<std::size_t>(1572864), "1.5MiB");
  expect(fc::parse_size("2g") == std::optional<std::size_t>(std::size_t(2) << 30), "2g");
  expect(fc::parse_size("10.9") == std::optional<std::size_t>(10), "fraction floors");
  expect(!fc::parse_size(""), "empty size");
  expect(!fc::parse_size("-1"), "negative size");
  expect(!fc::parse_size("12 parsecs"), "unknown unit");

  // Escapes
  std::string err;
  expect(fc::unescape_bytes("\\n.?") == std::optional<std::string>("\n.?"), "\\n escape");
  expect(fc::unescape_bytes("\\xE2\\x96\\x81") == std::optional<std::string>("\xE2\x96\x81"), "\\x escapes");
  expect(fc::unescape_bytes("a\\0b") == std::optional<std::string>(std::string("a\0b", 3)), "\\0 escape");
  expect(!fc::unescape_bytes("abc\\", &err) && err == "dangling backslash", "dangling backslash");
  expect(!fc::unescape_bytes("\\xZZ", &err) && err == "bad \\x escape", "bad \\x escape");

  // JSON config file
  {
    fc::RunConfig cfg;
    err.clear();
    expect(fc::load_config_json("tests/data/config_pattern.json", cfg, &err), "load config_pattern.json: " + err);
    expect(cfg.chunker.target_size == 64, "json size");
    expect(cfg.chunker.mode == fc::ChunkerConfig::Mode::Pattern, "json pattern mode");
    expect(cfg.chunker.pattern == "\xE2\x96\x81", "json pattern bytes");
    expect(cfg.chunker.prefix, "json prefix");
    expect(cfg.emit == fc::EmitMode::Offsets, "json emit");
    expect(cfg.slug_len == 12 && cfg.port == 18181, "json slug_len/port");
    expect(cfg.config_path == "tests/data/config_pattern.json", "config_path recorded");
  }
  {
    fc::RunConfig cfg;
    err.clear();
    expect(!fc::load_config_json("tests/data/config_bad_size.json", cfg, &err), "bad size rejected");
    expect(err == "invalid size: 12 parsecs", "bad size message: " + err);
  }
  {
    fc::RunConfig cfg;
    expect(!fc::load_config_json("tests/data/nope.json", cfg, &err), "missing config file rejected");
  }
  {
    fc::RunConfig cfg;
    err.clear();
    expect(fc::load_config_json("configs/chunker.json", cfg, &err), "shipped config loads: " + err);
    expect(cfg.chunker.target_size == 4096 && cfg.chunker.delimiters == "\n.?", "shipped config values");
  }

  // CLI: flags override the config file whatever their position.
  {
    fc::RunConfig cfg;
    err.clear();
    bool ok = run_cli({"--size=32", "--config=tests/data/config_pattern.json", "--delimiters=\\n.",
                       "--emit=chunks", "--scan", "a.txt", "--scan=b.txt"}, cfg, &err);
    expect(ok, "cli parse: " + err);
    expect(cfg.chunker.target_size == 32, "cli size overrides json");
    expect(cfg.chunker.mode == fc::ChunkerConfig::Mode::Delimiters, "last mode flag wins");
    expect(cfg.chunker.delimiters == "\n.", "cli delimiters unescaped");
    expect(cfg.emit == fc::EmitMode::Chunks, "cli emit");
    expect(cfg.scans == std::vector<std::string>{"a.txt", "b.txt"}, "cli scans");
    expect(cfg.port == 18181, "json port kept");
  }
  {
    fc::RunConfig cfg;
    expect(!run_cli({"--bogus"}, cfg, &err) && err == "unknown argument: --bogus", "unknown argument");
    expect(!run_cli({"--size=0.5x"}, cfg, &err), "bad --size");
    expect(!run_cli({"--emit=xml"}, cfg, &err), "bad --emit");
  }
  {
    fc::RunConfig cfg;
    expect(run_cli({"--help"}, cfg, &err) && cfg.show_help, "--help");
    expect(fc::emit_name(fc::EmitMode::Offsets) == "offsets", "emit_name");
  }

  if (failures) { std::cerr << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] run config\n";
  return 0;
}
