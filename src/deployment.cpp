#include "deployment.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <string>

namespace dotres {

namespace {

constexpr char kDeploymentFile[]{ ".deployment" };

// Quoted values end at the closing quote. Unquoted values end at an inline
// comment, a ';' or '#' preceded by whitespace.
std::string_view parse_value(std::string_view raw) {
  auto const value{ util_trim(raw) };
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
    if (auto const close{ value.find(value.front(), 1) }; close != std::string_view::npos) {
      return value.substr(1, close - 1);
    }
  }

  for (size_t i{ 1 }; i < value.size(); ++i) {
    if ((value[i] == ';' || value[i] == '#') && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
      return util_trim(value.substr(0, i));
    }
  }
  return value;
}

}  // namespace

ini_t deployment_parse_ini(std::string_view content) {
  ini_t result;
  std::string section;
  size_t line_no{ 0 };

  for (auto const &raw : util_split(content, '\n')) {
    ++line_no;
    auto const line{ util_trim(raw) };
    if (line.empty() || line.front() == ';' || line.front() == '#') { continue; }

    if (line.front() == '[') {
      if (line.back() != ']') {
        throw deployment_error("deployment: unterminated section header on line " +
                               std::to_string(line_no));
      }
      section = std::string{ util_trim(line.substr(1, line.size() - 2)) };
      result[section];
      continue;
    }

    auto const eq{ line.find_first_of("=:") };
    if (eq == std::string_view::npos) {
      throw deployment_error("deployment: expected key = value on line " +
                             std::to_string(line_no));
    }

    auto const key{ util_trim(line.substr(0, eq)) };
    if (key.empty()) {
      throw deployment_error("deployment: empty key on line " + std::to_string(line_no));
    }
    result[section][std::string{ key }] =
        std::string{ parse_value(line.substr(eq + 1)) };
  }

  return result;
}

deployment_hint deployment_parse(std::string_view content) {
  auto const ini{ deployment_parse_ini(content) };

  auto const config{ ini.find("config") };
  if (config == ini.end()) {
    throw deployment_error("deployment: section 'config' does not exist");
  }

  auto const project{ config->second.find("project") };
  if (project == config->second.end() || project->second.empty()) {
    throw deployment_error("deployment: key 'project' not found in section 'config'");
  }

  return deployment_hint{ .project = project->second };
}

std::optional<deployment_hint> deployment_load(std::filesystem::path const &build_dir) {
  auto const path{ build_dir / kDeploymentFile };
  if (!platform::file_exists(path)) { return std::nullopt; }

  tui::debug("Reading deployment hint %s", path.string().c_str());
  return deployment_parse(util_load_file(path));
}

}  // namespace dotres
