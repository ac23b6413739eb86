#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fc {

// Values handed to the report template.
struct ReportContext {
  std::string title;
  std::string run_json;                                       // {{ctx}}
  std::vector<std::pair<std::string, std::string>> summary;   // {{#summary}}{{label}} {{value}}{{/summary}}
  std::vector<std::pair<std::string, std::string>> histogram; // {{#histogram}}{{bucket}} {{count}}{{/histogram}}
};

class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials"; // <name>.mustache -> {{> name}}
    std::vector<std::string> static_css;
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  bool render_to_file(std::string_view template_name,
                      const ReportContext& ctx,
                      std::string_view out_path);

  bool render_to_dir(std::string_view template_name,
                     const ReportContext& ctx,
                     std::string_view out_dir,
                     std::string_view out_name,
                     bool with_assets);

  const std::string& last_error() const noexcept { return err_; }

private:
  void copy_assets(const std::filesystem::path& out_dir);

  Config cfg_;
  std::string err_;
};

}
