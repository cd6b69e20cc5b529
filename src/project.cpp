#include "project.h"

#include "deployment.h"
#include "errors.h"
#include "platform.h"
#include "proj_file.h"
#include "runtime_config.h"
#include "tui.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace dotres {

namespace fs = std::filesystem;

namespace {

constexpr char kReservedDir[]{ ".cloudfoundry" };
constexpr std::string_view kRuntimeConfigSuffix{ ".runtimeconfig.json" };
constexpr std::array<std::string_view, 3> kProjExtensions{ ".csproj", ".vbproj", ".fsproj" };
constexpr char kPublishDir[]{ "dotnet_publish" };
constexpr char kLibrarySuffix[]{ ".dll" };

bool is_proj_file(fs::path const &path) {
  auto const ext{ path.extension().string() };
  return std::find(kProjExtensions.begin(), kProjExtensions.end(), ext) !=
         kProjExtensions.end();
}

// Removes a trailing ".<lowercase letters>proj", e.g. "app.csproj" -> "app".
std::string strip_proj_suffix(std::string name) {
  auto const dot{ name.rfind('.') };
  if (dot == std::string::npos) { return name; }

  std::string_view const ext{ std::string_view{ name }.substr(dot + 1) };
  if (ext.size() <= 4 || !ext.ends_with("proj")) { return name; }
  if (!std::all_of(ext.begin(), ext.end() - 4, [](char c) { return c >= 'a' && c <= 'z'; })) {
    return name;
  }

  name.erase(dot);
  return name;
}

// "./a/b/app.csproj" -> "a/b/app.csproj". Leading "." and ".." segments are dropped
// so the hint always resolves inside the build dir.
fs::path strip_leading_dots(std::string_view hint) {
  fs::path result;
  bool leading{ true };
  for (auto const &segment : fs::path{ hint }) {
    auto const s{ segment.string() };
    if (leading && (s.empty() || s == "/" || s.find_first_not_of('.') == std::string::npos)) {
      continue;
    }
    leading = false;
    result /= segment;
  }
  return result;
}

}  // namespace

project::project(fs::path build_dir, fs::path dep_dir, std::string deps_idx)
    : build_dir_{ std::move(build_dir) },
      dep_dir_{ std::move(dep_dir) },
      deps_idx_{ std::move(deps_idx) } {}

std::vector<fs::path> project::proj_file_paths() const {
  std::vector<fs::path> paths;

  fs::recursive_directory_iterator it{ build_dir_,
                                       fs::directory_options::skip_permission_denied };
  for (; it != fs::recursive_directory_iterator{}; ++it) {
    auto const &entry{ *it };
    if (entry.is_directory()) {
      if (entry.path().filename() == kReservedDir) { it.disable_recursion_pending(); }
      continue;
    }
    if (entry.is_regular_file() && is_proj_file(entry.path())) {
      paths.push_back(entry.path());
    }
  }

  std::sort(paths.begin(), paths.end());
  return paths;
}

fs::path project::runtime_config_file() const { return runtime_config_find(build_dir_); }

bool project::is_published() const { return !runtime_config_file().empty(); }

fs::path project::main_path() const {
  if (auto config{ runtime_config_file() }; !config.empty()) {
    tui::debug("Main path is runtime config %s", config.string().c_str());
    return config;
  }

  auto paths{ proj_file_paths() };
  if (paths.empty()) { return {}; }
  if (paths.size() == 1) { return std::move(paths.front()); }

  auto const hint{ deployment_load(build_dir_) };
  if (!hint) { throw ambiguous_project_error{ std::move(paths) }; }

  auto main{ (build_dir_ / strip_leading_dots(hint->project)).lexically_normal() };
  auto const rel{ main.lexically_relative(build_dir_) };
  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    throw deployment_error("deployment: project '" + hint->project +
                           "' is not inside the build directory");
  }
  tui::debug("Main path %s chosen by .deployment", main.string().c_str());
  return main;
}

std::string project::base_name(fs::path const &main) const {
  auto const filename{ main.filename().string() };
  if (filename.ends_with(kRuntimeConfigSuffix)) {
    return filename.substr(0, filename.size() - kRuntimeConfigSuffix.size());
  }

  if (auto assembly{ proj_file_assembly_name(main) }; !assembly.empty()) {
    tui::debug("Using AssemblyName '%s' from %s", assembly.c_str(), main.string().c_str());
    return strip_proj_suffix(std::move(assembly));
  }
  return strip_proj_suffix(filename);
}

std::string project::published_start_command(std::string const &base) const {
  fs::path search_root;
  fs::path visible_root;
  if (is_published()) {
    search_root = build_dir_;
    visible_root = "${HOME}";
  } else {
    search_root = dep_dir_ / kPublishDir;
    visible_root = fs::path{ "${DEPS_DIR}" } / deps_idx_ / kPublishDir;
  }

  if (auto const exe{ search_root / base };
      platform::file_exists(exe) && !fs::is_directory(exe)) {
    platform::make_executable(exe);
    return (visible_root / base).string();
  }

  std::string const library{ base + kLibrarySuffix };
  if (platform::file_exists(search_root / library)) {
    return (visible_root / library).string();
  }

  tui::debug("Nothing runnable named %s under %s", base.c_str(), search_root.string().c_str());
  return {};
}

std::string project::start_command() const {
  auto const main{ main_path() };
  if (main.empty()) { return {}; }
  return published_start_command(base_name(main));
}

}  // namespace dotres
