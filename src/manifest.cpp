#include "manifest.h"

#include "sol_util.h"
#include "tui.h"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace dotres {

namespace {

dependency parse_dependency(sol::object const &entry, size_t index) {
  std::string const context{ "DEPENDENCIES[" + std::to_string(index) + "]" };
  if (!entry.valid() || entry.get_type() != sol::type::table) {
    throw std::runtime_error(context + " must be a table");
  }

  sol::table const table{ entry.as<sol::table>() };
  dependency dep{
    .name = sol_util_get_required_string(table, "name", context),
    .version = sol_util_get_required_string(table, "version", context),
    .uri = sol_util_get_optional_string(table, "uri", context),
    .sha256 = sol_util_get_optional_string(table, "sha256", context),
  };

  if (dep.name.empty()) { throw std::runtime_error(context + ": name is empty"); }
  if (dep.version.empty()) { throw std::runtime_error(context + ": version is empty"); }
  return dep;
}

}  // namespace

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  std::filesystem::path candidate;
  if (explicit_path) {
    candidate = *explicit_path;
  } else if (char const *env{ std::getenv("DOTRES_MANIFEST") }; env && *env) {
    candidate = env;
  } else {
    throw std::runtime_error("manifest not specified (use --manifest or DOTRES_MANIFEST)");
  }

  auto const path{ std::filesystem::absolute(candidate) };
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("manifest not found: " + path.string());
  }
  return path;
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  return load(util_load_file(manifest_path), manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::string_view script,
                                         std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest (%zu bytes)", script.size());

  auto state{ sol_util_make_lua_state() };
  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("Failed to execute manifest script: ") +
                             err.what());
  }

  sol::object deps_obj = (*state)["DEPENDENCIES"];
  if (!deps_obj.valid() || deps_obj.get_type() != sol::type::table) {
    throw std::runtime_error("Manifest must define 'DEPENDENCIES' global as a table");
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;

  sol::table const deps_table{ deps_obj.as<sol::table>() };
  for (size_t i{ 1 }; i <= deps_table.size(); ++i) {
    sol::object const entry = deps_table[i];
    m->dependencies.push_back(parse_dependency(entry, i));
  }

  tui::debug("Manifest declares %zu dependencies", m->dependencies.size());
  return m;
}

std::vector<std::string> manifest::all_versions(std::string_view name) const {
  std::vector<std::string> versions;
  for (auto const &dep : dependencies) {
    if (dep.name == name) { versions.push_back(dep.version); }
  }
  return versions;
}

std::optional<dependency> manifest::find(std::string_view name,
                                         std::string_view version) const {
  for (auto const &dep : dependencies) {
    if (dep.name == name && dep.version == version) { return dep; }
  }
  return std::nullopt;
}

}  // namespace dotres
