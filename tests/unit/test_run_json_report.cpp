#include "fast_chunker/artifact_writer.hpp"
#include "fast_chunker/chunker.hpp"
#include "fast_chunker/metrics.hpp"
#include "fast_chunker/run_json.hpp"

#include <simdjson.h>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

int main() {
  const std::string text = "Hello. World. Test.";
  auto c = fc::make_chunker(text, 10, ".");
  if (!c) { std::cerr << "[FAIL] construct\n"; return 1; }

  fc::MetricsRegistry m;
  m.start_stage("chunk");
  const auto offs = c->collect_offsets();
  m.end_stage("chunk");
  for (const auto& [s, e] : offs) m.add_chunk(e - s);
  m.add_hard_splits(c->hard_splits());

  fc::RunJsonPayload p;
  p.stats = m.snapshot(2.0);
  p.wall_time_ms = 2.0;
  p.target_size = 10;
  p.mode = "delimiters";
  p.delimiters = ".\n";
  p.emit = "offsets";
  p.filename = "tests/data/sentences.txt";
  p.file_size = text.size();

  if (p.stats.chunks != 3 || p.stats.bytes != 19 || p.stats.min_chunk != 6 || p.stats.max_chunk != 7) {
    std::cerr << "[FAIL] stats chunks=" << p.stats.chunks << " bytes=" << p.stats.bytes << "\n";
    return 1;
  }
  // 6 and 7 byte chunks share the 4..7 bucket.
  if (p.stats.size_histogram.size() != 1 || p.stats.size_histogram[0].first != 7
      || p.stats.size_histogram[0].second != 3) {
    std::cerr << "[FAIL] histogram\n";
    return 1;
  }

  const std::string json = fc::RunJsonWriter::to_json(p);
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    simdjson::ondemand::document doc = parser.iterate(padded);
    std::uint64_t chunks = doc["chunks"].get_uint64();
    std::uint64_t hard = doc["hard_splits"].get_uint64();
    std::string stage;
    for (auto st : doc["stage_times"].get_array()) {
      std::string_view name = st["stage"].get_string();
      if (stage.empty()) stage = std::string(name);
    }
    simdjson::ondemand::object config = doc["config"].get_object();
    std::string delims = std::string(std::string_view(config["delimiters"].get_string()));
    std::string emit = std::string(std::string_view(config["emit"].get_string()));
    std::uint64_t file_size = doc["file_size"].get_uint64();
    if (chunks != 3 || hard != 0 || delims != ".\n" || emit != "offsets" || stage != "chunk"
        || file_size != 19) {
      std::cerr << "[FAIL] run.json fields: " << json << "\n";
      return 1;
    }
  } catch (const simdjson::simdjson_error& e) {
    std::cerr << "[FAIL] run.json does not parse: " << e.what() << "\n" << json << "\n";
    return 1;
  }

  if (fc::json_quote(std::string("a\x01\"", 3)) != "\"a\\u0001\\\"\"") {
    std::cerr << "[FAIL] json_quote control byte\n";
    return 1;
  }

  // Bytes outside well-formed UTF-8 become \u00XX, so the output still parses.
  {
    struct Case { std::string in; std::string decoded; };
    const Case cases[] = {
      {"ab\xE2\x96",             "ab\xC3\xA2\xC2\x96"},      // sequence cut by a hard split
      {"\xFF",                   "\xC3\xBF"},
      {"x\xE2\x96\x81y",         "x\xE2\x96\x81y"},          // valid U+2581 kept verbatim
      {"\xED\xA0\x80",           "\xC3\xAD\xC2\xA0\xC2\x80"}, // surrogate
      {"\xC0\xAF",               "\xC3\x80\xC2\xAF"},         // overlong '/'
    };
    for (const auto& c : cases) {
      const std::string quoted = fc::json_quote(c.in);
      try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(quoted);
        simdjson::ondemand::document doc = parser.iterate(padded);
        std::string_view got = doc.get_string();
        if (got != c.decoded) {
          std::cerr << "[FAIL] json_quote decodes to the wrong text: " << quoted << "\n";
          return 1;
        }
      } catch (const simdjson::simdjson_error& e) {
        std::cerr << "[FAIL] json_quote output does not parse: " << quoted << " (" << e.what() << ")\n";
        return 1;
      }
    }
    if (fc::json_quote("ab\xE2\x96") != "\"ab\\u00e2\\u0096\"") {
      std::cerr << "[FAIL] json_quote invalid byte escape\n";
      return 1;
    }

    fc::RunJsonPayload raw = p;
    raw.delimiters = "\xff";
    raw.pattern = "\xE2\x96";
    raw.filename = "notes\xE9.txt";
    const std::string raw_json = fc::RunJsonWriter::to_json(raw);
    try {
      simdjson::ondemand::parser parser;
      simdjson::padded_string padded(raw_json);
      simdjson::ondemand::document doc = parser.iterate(padded);
      simdjson::ondemand::object config = doc["config"].get_object();
      std::string_view delims = config["delimiters"].get_string();
      if (delims != "\xC3\xBF") { std::cerr << "[FAIL] delimiters \\xff round trip\n"; return 1; }
      std::string_view fname = doc["filename"].get_string();
      if (fname != "notes\xC3\xA9.txt") { std::cerr << "[FAIL] filename escape\n"; return 1; }
    } catch (const simdjson::simdjson_error& e) {
      std::cerr << "[FAIL] run.json with raw bytes does not parse: " << e.what() << "\n";
      return 1;
    }
  }

  const fs::path root = fs::temp_directory_path() / ("fc-report-" + std::to_string(std::time(nullptr)));
  std::string err;
  if (!fc::write_report_dir(root.string(), "sentences", p, &err)) {
    std::cerr << "[FAIL] write_report_dir: " << err << "\n";
    return 1;
  }
  for (const char* f : {"run.json", "report.html", "report.css"}) {
    if (!fs::exists(root / "sentences" / f)) { std::cerr << "[FAIL] missing " << f << "\n"; return 1; }
  }
  std::ifstream in(root / "sentences" / "report.html");
  std::ostringstream ss; ss << in.rdbuf();
  const std::string html = ss.str();
  if (html.find("fast-chunker: sentences.txt") == std::string::npos
      || html.find("hard splits") == std::string::npos
      || html.find("&lt;= 7") == std::string::npos
      || html.find("<th>emit</th><td>offsets</td>") == std::string::npos) {
    std::cerr << "[FAIL] report.html content\n";
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  std::cout << "[PASS] run.json + report written for " << p.stats.chunks << " chunks\n";
  return 0;
}
