#include "dotnet_framework.h"

#include "platform.h"
#include "runtime_config.h"
#include "tui.h"
#include "version.h"

#include <algorithm>
#include <utility>

namespace dotres {

namespace fs = std::filesystem;

dotnet_framework::dotnet_framework(fs::path build_dir,
                                   fs::path dep_dir,
                                   catalog_provider const &catalog)
    : build_dir_{ std::move(build_dir) }, dep_dir_{ std::move(dep_dir) }, catalog_{ catalog } {}

fs::path dotnet_framework::framework_dir() const {
  return dep_dir_ / "dotnet" / "shared" / "Microsoft.NETCore.App";
}

std::vector<std::string> dotnet_framework::required_versions() const {
  auto const config_path{ runtime_config_find(build_dir_) };
  if (config_path.empty()) { return restored_versions(); }

  auto const config{ runtime_config_load(config_path) };
  if (config.framework_version.empty()) { return {}; }

  if (!config.apply_patches) {
    if (!catalog_.find(kComponent, config.framework_version)) {
      tui::warn("%s %s is pinned by %s but not listed in the catalog",
                kComponent,
                config.framework_version.c_str(),
                config_path.filename().string().c_str());
    }
    return { config.framework_version };
  }

  return { resolve_patch(config.framework_version) };
}

// "2.0.0" -> "2.0.x", resolved to the newest matching patch release.
std::string dotnet_framework::resolve_patch(std::string const &version) const {
  auto segments{ util_split(version, '.') };
  while (segments.size() < 3) { segments.emplace_back("x"); }
  segments[2] = "x";

  auto const constraint{ util_join(segments, ".") };
  auto resolved{ version_resolve(constraint, catalog_.all_versions(kComponent)) };
  tui::debug("Resolved %s constraint %s to %s", kComponent, constraint.c_str(), resolved.c_str());
  return resolved;
}

std::vector<std::string> dotnet_framework::restored_versions() const {
  auto const restored_dir{ dep_dir_ / ".nuget" / "packages" / "microsoft.netcore.app" };
  if (!platform::file_exists(restored_dir)) { return {}; }

  std::vector<std::string> versions;
  for (auto const &entry : fs::directory_iterator{ restored_dir }) {
    if (entry.is_directory()) { versions.push_back(entry.path().filename().string()); }
  }
  std::sort(versions.begin(), versions.end());
  return versions;
}

bool dotnet_framework::is_installed(std::string const &version) const {
  auto const path{ framework_dir() / version };
  if (!platform::file_exists(path)) { return false; }

  tui::info("Using dotnet framework installed in %s", path.string().c_str());
  return true;
}

void dotnet_framework::install(installer &inst) const {
  auto const versions{ required_versions() };
  if (versions.empty()) { return; }

  tui::info("Required dotnetframework versions: [%s]", util_join(versions, " ").c_str());

  for (auto const &v : versions) {
    if (!is_installed(v)) { install_version(inst, v); }
  }
}

void dotnet_framework::install_version(installer &inst, std::string const &version) const {
  dependency dep{ .name = kComponent, .version = version };
  if (auto entry{ catalog_.find(kComponent, version) }) { dep = std::move(*entry); }

  inst.install_dependency(dep, dep_dir_ / "dotnet");
}

}  // namespace dotres
