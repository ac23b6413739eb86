#include "fast_chunker/http_server.hpp"
#include "fast_chunker/chunker.hpp"
#include "fast_chunker/run_config.hpp"
#include "fast_chunker/run_json.hpp"
#include <httplib.h>
#include <simdjson.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fc {

static std::string guess_mime(const std::string& name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.c_str() + (m - n),
                                [](char a, char b){ return std::tolower(a)==std::tolower(b); });
  };
  if (ends(".html")) return "text/html; charset=utf-8";
  if (ends(".css"))  return "text/css; charset=utf-8";
  if (ends(".json")) return "application/json; charset=utf-8";
  if (ends(".txt"))  return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

static std::string html_escape(std::string_view s) {
  std::string o;
  o.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': o += "&amp;"; break;
      case '<': o += "&lt;"; break;
      case '>': o += "&gt;"; break;
      case '"': o += "&quot;"; break;
      default:  o += c; break;
    }
  }
  return o;
}

// True when any '/'- or '\\'-separated segment of `p` is exactly "..".
static bool has_parent_segment(std::string_view p) {
  std::size_t start = 0;
  while (start <= p.size()) {
    std::size_t end = p.find_first_of("/\\", start);
    if (end == std::string_view::npos) end = p.size();
    if (p.substr(start, end - start) == "..") return true;
    start = end + 1;
  }
  return false;
}

struct ReportEntry {
  std::string slug;
  std::string filename;
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
};

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;
  bool bound = false;

  explicit Impl(Config c) : cfg(std::move(c)) {}

  // Summary fields from <slug>/run.json; entries without a readable run.json
  // are listed by slug only.
  static void read_summary(const std::filesystem::path& run_json, ReportEntry& e) {
    try {
      simdjson::ondemand::parser parser;
      simdjson::padded_string json = simdjson::padded_string::load(run_json.string());
      simdjson::ondemand::document doc = parser.iterate(json);
      e.chunks = doc["chunks"].get_uint64();
      e.bytes = doc["bytes"].get_uint64();
      e.filename = std::string(std::string_view(doc["filename"].get_string()));
    } catch (const simdjson::simdjson_error& ex) {
      std::cerr << "[serve] unreadable " << run_json << ": " << ex.what() << "\n";
    }
  }

  std::vector<ReportEntry> reports() const {
    std::vector<ReportEntry> out;
    std::filesystem::path root(cfg.artifact_root);
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) return out;
    for (auto& d : std::filesystem::directory_iterator(root, ec)) {
      if (!d.is_directory()) continue;
      ReportEntry e;
      e.slug = d.path().filename().string();
      if (std::filesystem::exists(d.path() / "run.json")) read_summary(d.path() / "run.json", e);
      out.push_back(std::move(e));
    }
    std::sort(out.begin(), out.end(),
              [](const ReportEntry& a, const ReportEntry& b){ return a.slug < b.slug; });
    return out;
  }

  std::string index_html() const {
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += html_escape(cfg.index_title) + "</title></head><body><h1>" + html_escape(cfg.index_title) + "</h1><ul>";
    for (auto& r : reports()) {
      html += "<li><a href=\"/reports/" + html_escape(r.slug) + "/report.html\">" + html_escape(r.slug) + "</a>";
      if (!r.filename.empty()) {
        html += " " + html_escape(r.filename) + " (" + std::to_string(r.chunks) + " chunks, "
              + std::to_string(r.bytes) + " bytes)";
      }
      html += "</li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Serve a file under artifact_root/<slug>/<rel>, preventing traversal.
  void serve_under_slug(const std::string& slug,
                        const std::string& rel,
                        httplib::Response& res) const {
    if (has_parent_segment(rel) || has_parent_segment(slug)) { res.status = 400; return; }

    std::filesystem::path base = std::filesystem::path(cfg.artifact_root) / slug;
    std::error_code ec;
    auto base_canon = std::filesystem::weakly_canonical(base, ec);
    if (ec) { res.status = 404; return; }

    auto target_canon = std::filesystem::weakly_canonical(base_canon / rel, ec);
    if (ec) { res.status = 404; return; }

    auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(), target_canon.begin(), target_canon.end());
    if (mismatch.first != base_canon.end()) { res.status = 403; return; }

    std::ifstream in(target_canon, std::ios::binary);
    if (!in) { res.status = 404; return; }

    std::ostringstream ss; ss << in.rdbuf();
    res.set_content(ss.str(), guess_mime(target_canon.filename().string()).c_str());
  }

  static void reply_error(httplib::Response& res, int status, const std::string& msg) {
    res.status = status;
    res.set_content("{\"error\":" + json_quote(msg) + "}", "application/json; charset=utf-8");
  }

  // Each request builds its own chunker over the request body.
  void chunk_body(const httplib::Request& req, httplib::Response& res) const {
    ChunkerConfig cc;
    if (req.has_param("size")) {
      auto n = parse_size(req.get_param_value("size"));
      if (!n) return reply_error(res, 400, "invalid size");
      cc.target_size = *n;
    }
    if (req.has_param("delimiters")) cc.delimiters = req.get_param_value("delimiters");
    if (req.has_param("pattern")) {
      cc.mode = ChunkerConfig::Mode::Pattern;
      cc.pattern = req.get_param_value("pattern");
    }
    if (req.has_param("prefix")) cc.prefix = req.get_param_value("prefix") == "true";
    if (req.has_param("consecutive")) cc.consecutive = req.get_param_value("consecutive") == "true";

    std::string err;
    auto chunker = Chunker::create(req.body, cc, &err);
    if (!chunker) return reply_error(res, 400, err);

    const auto flat = flatten_offsets(chunker->collect_offsets());
    std::ostringstream o;
    o << "{\"chunks\":" << flat.size() / 2
      << ",\"hard_splits\":" << chunker->hard_splits()
      << ",\"offsets\":[";
    for (size_t i = 0; i < flat.size(); ++i) { if (i) o << ","; o << flat[i]; }
    o << "]}";
    res.set_content(o.str(), "application/json; charset=utf-8");
  }

  void routes() {
    svr.set_payload_max_length(cfg.max_body_bytes);

    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get(R"(/reports/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_under_slug(req.matches[1].str(), req.matches[2].str(), res);
    });

    svr.Post("/chunk", [this](const httplib::Request& req, httplib::Response& res) {
      chunk_body(req, res);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (!p_->bound) p_->bound = p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port);
  return p_->bound;
}

int HttpServer::run() {
  if (!start()) return -1;
  std::cerr << "[serve] listening on " << p_->cfg.host << ":" << p_->cfg.port
            << " root=" << p_->cfg.artifact_root << "\n";
  return p_->svr.listen_after_bind() ? 0 : -1;
}

void HttpServer::stop() { p_->svr.stop(); }

}
