#include "cmd_common.h"

#include "manifest.h"
#include "project.h"

#include "CLI11.hpp"

#include <stdexcept>

namespace dotres {

void add_build_location_options(CLI::App &sub, build_location &loc, bool with_deps) {
  sub.add_option("--build-dir", loc.build_dir, "Application source tree")
      ->check(CLI::ExistingDirectory);
  if (!with_deps) { return; }

  sub.add_option("--deps-dir", loc.deps_dir, "Dependency staging root")->required();
  sub.add_option("--deps-idx", loc.deps_idx, "Index of this build under --deps-dir");
}

std::filesystem::path dep_dir_for(build_location const &loc) {
  if (!loc.deps_dir) { return {}; }
  return *loc.deps_dir / loc.deps_idx;
}

project make_project(build_location const &loc) {
  return project{ std::filesystem::absolute(loc.build_dir), dep_dir_for(loc), loc.deps_idx };
}

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path) {
  auto const path{ manifest::find_manifest_path(manifest_path) };
  auto m{ manifest::load(path) };
  if (!m) { throw std::runtime_error("could not load manifest"); }
  return m;
}

}  // namespace dotres
