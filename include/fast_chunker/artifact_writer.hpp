#pragma once
#include "fast_chunker/run_json.hpp"
#include <string>

namespace fc {

// Writes
//   <artifact_root>/<slug>/run.json
//   <artifact_root>/<slug>/report.html  (+ report.css)
bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const RunJsonPayload& payload,
                      std::string* err_out = nullptr);

}
