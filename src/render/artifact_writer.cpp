#include "fast_chunker/artifact_writer.hpp"
#include "fast_chunker/mustache_renderer.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fc {

static std::string fmt_num(double v, int prec = 2) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(prec) << v;
  return o.str();
}

static ReportContext make_context(const RunJsonPayload& p, std::string run_json) {
  const ChunkStats& s = p.stats;
  ReportContext ctx;
  ctx.title = "fast-chunker: " + std::filesystem::path(p.filename).filename().string();
  ctx.run_json = std::move(run_json);
  ctx.summary = {
    {"file",            p.filename},
    {"file size",       std::to_string(p.file_size)},
    {"mode",            p.mode},
    {"target size",     std::to_string(p.target_size)},
    {"prefix",          p.prefix ? "yes" : "no"},
    {"emit",            p.emit},
    {"chunks",          std::to_string(s.chunks)},
    {"hard splits",     std::to_string(s.hard_splits)},
    {"min / max chunk", std::to_string(s.min_chunk) + " / " + std::to_string(s.max_chunk)},
    {"mean chunk",      fmt_num(s.mean_chunk)},
    {"wall time (ms)",  fmt_num(p.wall_time_ms, 3)},
    {"throughput MB/s", fmt_num(s.throughput_mb_s)},
  };
  for (const auto& [le, count] : s.size_histogram)
    ctx.histogram.emplace_back("<= " + std::to_string(le), std::to_string(count));
  return ctx;
}

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const RunJsonPayload& payload,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;
  const std::string run_json = RunJsonWriter::to_json(payload);

  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    std::ofstream rj(out_dir / "run.json", std::ios::binary);
    if (ec || !rj) {
      if (err_out) *err_out = "failed to write run.json under " + out_dir.string();
      return false;
    }
    rj.write(run_json.data(), static_cast<std::streamsize>(run_json.size()));
  }

  MustacheRenderer::Config rcfg;
#ifdef FC_DEFAULT_TEMPLATE_DIR
  rcfg.template_dir = FC_DEFAULT_TEMPLATE_DIR;
#else
  rcfg.template_dir = "templates";
#endif
  rcfg.partials_dir = rcfg.template_dir + "/partials";
  rcfg.static_css   = {"web/css/report.css"};

  MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_dir("report.mustache",
                                         make_context(payload, run_json),
                                         out_dir.string(),
                                         "report.html",
                                         /*with_assets=*/true);
  if (!ok && err_out) *err_out = renderer.last_error();
  return ok;
}

}
