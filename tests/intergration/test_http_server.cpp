#include "fast_chunker/artifact_writer.hpp"
#include "fast_chunker/http_server.hpp"
#include "fast_chunker/run_json.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <ctime>
#include "httplib.h"
#include <simdjson.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

int main() {
  const int port = 18080;
  fs::path art = fs::temp_directory_path() / ("fc-http-" + std::to_string(std::time(nullptr)));
  fs::create_directories(art);

  // One report to list on the index page.
  fc::RunJsonPayload p;
  p.stats.chunks = 3;
  p.stats.bytes = 19;
  p.mode = "delimiters";
  p.target_size = 10;
  p.filename = "sentences.txt";
  std::string err;
  if (!fc::write_report_dir(art.string(), "sentences", p, &err)) {
    std::cerr << "[FAIL] write_report_dir: " << err << "\n";
    return 1;
  }

  // A ".." inside a name is not a parent reference and must still be served.
  if (!fc::write_report_dir(art.string(), "notes..v2.txt", p, &err)) {
    std::cerr << "[FAIL] write_report_dir notes..v2.txt: " << err << "\n";
    return 1;
  }

  fc::HttpServer::Config cfg;
  cfg.artifact_root = art.string();
  cfg.host = "127.0.0.1";
  cfg.port = port;
  fc::HttpServer server(cfg);
  if (!server.start()) { std::cerr << "[FAIL] could not bind port " << port << "\n"; return 1; }
  std::thread th([&]{ server.run(); });

  // Poll for readiness
  httplib::Client cli("127.0.0.1", port);
  bool up = false;
  std::string index;
  for (int i=0;i<50;i++) {
    if (auto res = cli.Get("/")) {
      if (res->status == 200 && !res->body.empty()) { up = true; index = res->body; break; }
    }
    std::this_thread::sleep_for(100ms);
  }

  bool ok = up;
  if (!up) std::cerr << "[FAIL] server did not respond with 200 on /\n";

  if (ok && index.find("/reports/sentences/report.html") == std::string::npos) {
    std::cerr << "[FAIL] index does not list the report\n"; ok = false;
  }
  if (ok && index.find("3 chunks") == std::string::npos) {
    std::cerr << "[FAIL] index summary missing chunk count\n"; ok = false;
  }

  if (ok) {
    auto res = cli.Get("/reports/sentences/run.json");
    if (!res || res->status != 200) { std::cerr << "[FAIL] run.json not served\n"; ok = false; }
    auto bad = cli.Get("/reports/sentences/../../etc/passwd");
    if (bad && bad->status == 200) { std::cerr << "[FAIL] traversal served a file\n"; ok = false; }
    auto dotted = cli.Get("/reports/notes..v2.txt/run.json");
    if (!dotted || dotted->status != 200) { std::cerr << "[FAIL] dotted slug not served\n"; ok = false; }
    auto parent = cli.Get("/reports/sentences/..%2F..%2Fetc%2Fpasswd");
    if (parent && parent->status == 200) { std::cerr << "[FAIL] encoded traversal served a file\n"; ok = false; }
  }

  if (ok) {
    auto res = cli.Post("/chunk?size=10&delimiters=.", "Hello. World. Test.", "text/plain");
    if (!res || res->status != 200) {
      std::cerr << "[FAIL] POST /chunk failed\n"; ok = false;
    } else if (res->body != "{\"chunks\":3,\"hard_splits\":0,\"offsets\":[0,6,6,13,13,19]}") {
      std::cerr << "[FAIL] POST /chunk body: " << res->body << "\n"; ok = false;
    } else {
      // Output must be well-formed JSON for clients.
      simdjson::ondemand::parser parser;
      simdjson::padded_string body(res->body);
      auto doc = parser.iterate(body);
      if (doc["chunks"].get_uint64().value_or(0) != 3) { std::cerr << "[FAIL] /chunk json\n"; ok = false; }
    }
  }

  if (ok) {
    auto res = cli.Post("/chunk?size=0", "abc", "text/plain");
    if (!res || res->status != 400 || res->body.find("target_size must be > 0") == std::string::npos) {
      std::cerr << "[FAIL] POST /chunk with size=0 should be 400\n"; ok = false;
    }
  }

  server.stop();
  th.join();
  std::error_code ec;
  fs::remove_all(art, ec);

  if (!ok) return 1;
  std::cout << "[PASS] http server index, report files and POST /chunk\n";
  return 0;
}
