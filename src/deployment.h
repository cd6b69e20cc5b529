#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dotres {

// Parsed .deployment sidecar. Only [config] project is consumed.
struct deployment_hint {
  std::string project;  // as written, e.g. "./src/app/app.csproj"
};

using ini_section_t = std::map<std::string, std::string>;
using ini_t = std::map<std::string, ini_section_t>;

// Minimal INI reader: [section] headers, key = value pairs, ';' and '#' comments.
// Keys before the first header land in section "". Throws deployment_error on lines
// that are neither.
ini_t deployment_parse_ini(std::string_view content);

// Throws deployment_error if [config] or its project key is missing or empty.
deployment_hint deployment_parse(std::string_view content);

// Reads <build_dir>/.deployment. nullopt if the file does not exist.
std::optional<deployment_hint> deployment_load(std::filesystem::path const &build_dir);

}  // namespace dotres
