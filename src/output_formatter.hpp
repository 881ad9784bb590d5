#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct InvocationState;

struct OutputOptions {
  std::string format = "tmpl";   // tmpl, json or jsonp
  std::string templ;             // "{{.name}}\t{{.size}}"; empty uses the default columns
  bool template_tabs = true;     // align tab-separated fields into columns
  bool quiet = false;            // omit the header row
};

// Reads volctl.cli.* from the config and --quiet from the flags.
OutputOptions output_options(const InvocationState& state);

class OutputFormatter {
public:
  explicit OutputFormatter(OutputOptions options);

  // `data` is an object or an array of objects; scalars print as they are.
  bool render(const nlohmann::json& data,
              const std::vector<std::string>& columns,
              std::ostream& out,
              std::string& error) const;

  static std::string expand_template(const std::string& templ, const nlohmann::json& item);
  static std::vector<std::string> align_columns(const std::vector<std::string>& lines);

private:
  bool render_template(const nlohmann::json& data,
                       const std::vector<std::string>& columns,
                       std::ostream& out) const;

  OutputOptions options_;
};
