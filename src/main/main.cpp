#include "fast_chunker/artifact_writer.hpp"
#include "fast_chunker/chunker.hpp"
#include "fast_chunker/file_loader.hpp"
#include "fast_chunker/http_server.hpp"
#include "fast_chunker/metrics.hpp"
#include "fast_chunker/path_utils.hpp"
#include "fast_chunker/run_config.hpp"
#include "fast_chunker/run_json.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // hashprefix hashes the absolute path so reruns land in the same directory.
  std::string key = path;
  if (mode == "hashprefix") {
    std::error_code ec;
    auto canon = std::filesystem::weakly_canonical(std::filesystem::path(path), ec);
    if (!ec) key = canon.string();
  }
  return fc::make_slug(key, mode, len);
}

void emit_chunks(const fc::RunConfig& cfg, std::string_view text, const fc::Offsets& offs) {
  switch (cfg.emit) {
    case fc::EmitMode::Summary:
      break;
    case fc::EmitMode::Offsets:
      for (const auto& [s, e] : offs) std::cout << s << '\t' << e << '\n';
      break;
    case fc::EmitMode::Chunks:
      // one JSON string per line
      for (const auto& [s, e] : offs) std::cout << fc::json_quote(text.substr(s, e - s)) << '\n';
      break;
  }
}

int chunk_one_file(const std::string& filepath, const fc::RunConfig& cfg) {
  namespace ch = std::chrono;
  fc::MetricsRegistry metrics;

  metrics.start_stage("load");
  fc::FileLoader loader(filepath);
  std::string text;
  if (!loader.load(text)) {
    std::cerr << "[scan] cannot read " << filepath << ": " << std::strerror(loader.last_error()) << "\n";
    return 2;
  }
  metrics.end_stage("load");

  std::string err;
  auto chunker = fc::Chunker::create_owned(std::move(text), cfg.chunker, &err);
  if (!chunker) {
    std::cerr << "[scan] invalid chunker config: " << err << "\n";
    return 3;
  }

  metrics.start_stage("chunk");
  const auto t0 = ch::steady_clock::now();
  const fc::Offsets offs = chunker->collect_offsets();
  const auto t1 = ch::steady_clock::now();
  metrics.end_stage("chunk");
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();

  for (const auto& [s, e] : offs) metrics.add_chunk(e - s);
  metrics.add_hard_splits(chunker->hard_splits());

  metrics.start_stage("emit");
  emit_chunks(cfg, chunker->text(), offs);
  metrics.end_stage("emit");

  const auto& cc = chunker->config();
  fc::RunJsonPayload p;
  p.wall_time_ms = wall_ms;
  p.target_size = cc.target_size;
  p.mode = (cc.mode == fc::ChunkerConfig::Mode::Pattern) ? "pattern" : "delimiters";
  p.delimiters = cc.delimiters;
  p.pattern = cc.pattern;
  p.prefix = cc.prefix;
  p.consecutive = cc.consecutive;
  p.emit = std::string(fc::emit_name(cfg.emit));
  p.filename = filepath;
  p.file_size = loader.bytes_read();

  metrics.start_stage("report");
  const std::string slug = make_slug_for(filepath, cfg.slug_mode, cfg.slug_len);
  p.stats = metrics.snapshot(wall_ms);
  if (!fc::write_report_dir(cfg.artifact_root, slug, p, &err)) {
    std::cerr << "[scan] write_report_dir failed: " << err << "\n";
    return 2;
  }
  metrics.end_stage("report");

  std::cerr << "[scan] ok: " << filepath
            << " chunks=" << p.stats.chunks
            << " hard_splits=" << p.stats.hard_splits
            << " MB/s=" << p.stats.throughput_mb_s
            << " -> " << (std::filesystem::path(cfg.artifact_root) / slug / "report.html").string()
            << "\n";
  return 0;
}

}

int main(int argc, char** argv) {
  fc::RunConfig cfg;
  std::string err;
  if (!fc::parse_cli(argc, argv, cfg, &err)) {
    std::cerr << "[config] " << err << "\n" << fc::usage();
    return 3;
  }
  if (cfg.show_help) {
    std::cout << fc::usage();
    return 0;
  }
  if (!cfg.chunker.validate(&err)) {
    std::cerr << "[config] " << err << "\n";
    return 3;
  }

  if (!cfg.serve_only && !cfg.scans.empty()) {
    int rc = 0;
    for (const auto& f : cfg.scans) rc = std::max(rc, chunk_one_file(f, cfg));
    return rc;
  }

  fc::HttpServer::Config scfg;
  scfg.port = cfg.port;
  scfg.artifact_root = cfg.artifact_root;

  fc::HttpServer server(scfg);
  int rc = server.run();
  if (rc != 0) {
    std::cerr << "[serve] failed to start on port " << scfg.port << "\n";
    return 2;
  }
  return 0;
}
