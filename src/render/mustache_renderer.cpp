#include "fast_chunker/mustache_renderer.hpp"
#include "fast_chunker/path_utils.hpp"

#include <kainjow/mustache.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fc {

namespace mstch = kainjow::mustache;
namespace fs = std::filesystem;

MustacheRenderer::MustacheRenderer() : cfg_{} {}
MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static bool read_file(const fs::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss; ss << in.rdbuf();
  out = ss.str();
  return true;
}

// Every <partials_dir>/<name>.mustache becomes "{{> name}}".
static void register_partials(const fs::path& dir, mstch::data& data) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".mustache") continue;
    std::string body;
    if (!read_file(entry.path(), body)) continue;
    data.set(entry.path().stem().string(),
             mstch::partial([body]() { return body; }));
  }
}

static mstch::data rows(const std::vector<std::pair<std::string, std::string>>& kv,
                        const char* k_name, const char* v_name) {
  mstch::data list{mstch::data::type::list};
  for (const auto& [k, v] : kv) {
    mstch::data row;
    row.set(k_name, k);
    row.set(v_name, v);
    list.push_back(row);
  }
  return list;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const ReportContext& ctx,
                                      std::string_view out_path) {
  err_.clear();

  const fs::path tpl_path = fs::path(cfg_.template_dir) / std::string(template_name);
  std::string tpl;
  if (!read_file(tpl_path, tpl)) { err_ = "open failed: " + tpl_path.string(); return false; }

  mstch::mustache view(tpl);
  if (!view.is_valid()) { err_ = tpl_path.string() + ": " + view.error_message(); return false; }

  mstch::data data;
  register_partials(fs::path(cfg_.partials_dir), data);
  data.set("title", ctx.title);
  data.set("ctx", ctx.run_json);
  data.set("summary", rows(ctx.summary, "label", "value"));
  data.set("histogram", rows(ctx.histogram, "bucket", "count"));

  const std::string rendered = view.render(data);
  if (!view.is_valid()) { err_ = tpl_path.string() + ": " + view.error_message(); return false; }

  if (!ensure_parent_dirs(fs::path(std::string(out_path)))) {
    err_ = "cannot create directory for " + std::string(out_path);
    return false;
  }
  std::ofstream out(std::string(out_path), std::ios::binary);
  if (!out) { err_ = "write failed: " + std::string(out_path); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  return static_cast<bool>(out);
}

// Stylesheets are looked up as given, then under FC_DEFAULT_STATIC_DIR.
// A missing stylesheet only degrades the report; it is noted in last_error().
void MustacheRenderer::copy_assets(const fs::path& out_dir) {
  const std::vector<std::string> css = cfg_.static_css.empty()
      ? std::vector<std::string>{"web/css/report.css"}
      : cfg_.static_css;

  for (const auto& hint : css) {
    fs::path src = hint;
#ifdef FC_DEFAULT_STATIC_DIR
    if (!fs::exists(src)) src = fs::path(FC_DEFAULT_STATIC_DIR) / hint;
#endif
    if (!fs::exists(src)) { err_ += "asset not found: " + hint + "\n"; continue; }

    std::error_code ec;
    fs::copy_file(src, out_dir / src.filename(), fs::copy_options::overwrite_existing, ec);
    if (ec) err_ += "copy failed: " + src.string() + " (" + ec.message() + ")\n";
  }
}

bool MustacheRenderer::render_to_dir(std::string_view template_name,
                                     const ReportContext& ctx,
                                     std::string_view out_dir,
                                     std::string_view out_name,
                                     bool with_assets) {
  const fs::path dir{std::string(out_dir)};
  if (!render_to_file(template_name, ctx, (dir / std::string(out_name)).string())) return false;
  if (with_assets) copy_assets(dir);
  return true;
}

}
