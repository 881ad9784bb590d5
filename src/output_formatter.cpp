#include "output_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>

#include "invocation_state.hpp"

namespace {

std::string scalar_text(const nlohmann::json& value) {
  if(value.is_null()) return "";
  if(value.is_string()) return value.get<std::string>();
  return value.dump();
}

const nlohmann::json* lookup(const nlohmann::json& item, const std::string& dotted) {
  const nlohmann::json* at = &item;
  std::size_t start = 0;
  while(start <= dotted.size()) {
    const auto end = dotted.find('.', start);
    const auto part = dotted.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if(!at->is_object() || !at->contains(part)) return nullptr;
    at = &at->at(part);
    if(end == std::string::npos) break;
    start = end + 1;
  }
  return at;
}

std::vector<std::string> split(const std::string& text, char sep) {
  std::vector<std::string> out;
  std::string current;
  for(char ch : text) {
    if(ch == sep) {
      out.push_back(current);
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  out.push_back(current);
  return out;
}

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return text;
}

} // namespace

OutputOptions output_options(const InvocationState& state) {
  OutputOptions options;
  options.format = ConfigStore::to_lower(state.config.get_string("volctl.cli.format"));
  options.templ = state.config.get_string("volctl.cli.template");
  options.template_tabs = state.config.get_bool("volctl.cli.templateTabs");
  options.quiet = state.flags.get_bool("quiet");
  return options;
}

OutputFormatter::OutputFormatter(OutputOptions options)
  : options_(std::move(options)) {}

bool OutputFormatter::render(const nlohmann::json& data,
                             const std::vector<std::string>& columns,
                             std::ostream& out,
                             std::string& error) const {
  if(options_.format == "json") {
    out << data.dump() << "\n";
    return true;
  }
  if(options_.format == "jsonp") {
    out << data.dump(2) << "\n";
    return true;
  }
  if(options_.format == "tmpl" || options_.format.empty()) {
    return render_template(data, columns, out);
  }
  error = "invalid output format '" + options_.format + "' (expected tmpl, json or jsonp)";
  return false;
}

bool OutputFormatter::render_template(const nlohmann::json& data,
                                      const std::vector<std::string>& columns,
                                      std::ostream& out) const {
  if(!data.is_array() && !data.is_object()) {
    out << scalar_text(data) << "\n";
    return true;
  }

  std::string templ = options_.templ;
  std::vector<std::string> lines;
  if(templ.empty()) {
    if(columns.empty()) {
      out << data.dump(2) << "\n";
      return true;
    }
    std::string header;
    for(const auto& column : columns) {
      if(!templ.empty()) {
        templ += "\t";
        header += "\t";
      }
      templ += "{{." + column + "}}";
      header += upper(column);
    }
    if(!options_.quiet) lines.push_back(header);
  }

  if(data.is_array()) {
    for(const auto& item : data) lines.push_back(expand_template(templ, item));
  } else {
    lines.push_back(expand_template(templ, data));
  }

  if(options_.template_tabs) lines = align_columns(lines);
  for(const auto& line : lines) out << line << "\n";
  return true;
}

std::string OutputFormatter::expand_template(const std::string& templ, const nlohmann::json& item) {
  std::string out;
  std::size_t pos = 0;
  while(pos < templ.size()) {
    const auto open = templ.find("{{", pos);
    if(open == std::string::npos) {
      out += templ.substr(pos);
      break;
    }
    const auto close = templ.find("}}", open + 2);
    if(close == std::string::npos) {
      out += templ.substr(pos);
      break;
    }
    out += templ.substr(pos, open - pos);
    auto field = ConfigStore::trim_copy(templ.substr(open + 2, close - open - 2));
    if(field == ".") {
      out += scalar_text(item);
    } else {
      if(!field.empty() && field[0] == '.') field.erase(0, 1);
      if(const auto* value = lookup(item, field)) out += scalar_text(*value);
    }
    pos = close + 2;
  }
  return out;
}

std::vector<std::string> OutputFormatter::align_columns(const std::vector<std::string>& lines) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::size_t> widths;
  for(const auto& line : lines) {
    rows.push_back(split(line, '\t'));
    const auto& cells = rows.back();
    if(widths.size() < cells.size()) widths.resize(cells.size(), 0);
    for(std::size_t i = 0; i < cells.size(); ++i) {
      widths[i] = std::max(widths[i], cells[i].size());
    }
  }

  std::vector<std::string> out;
  for(const auto& cells : rows) {
    std::string line;
    for(std::size_t i = 0; i < cells.size(); ++i) {
      line += cells[i];
      if(i + 1 < cells.size()) {
        line += std::string(widths[i] - cells[i].size() + 2, ' ');
      }
    }
    out.push_back(std::move(line));
  }
  return out;
}
