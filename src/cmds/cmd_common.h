#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace dotres {

struct manifest;
class project;

// Locations shared by every command that inspects an app.
struct build_location {
  std::filesystem::path build_dir{ "." };
  std::optional<std::filesystem::path> deps_dir;
  std::string deps_idx{ "0" };
};

// Adds --build-dir, and with `with_deps` also --deps-dir and --deps-idx.
void add_build_location_options(CLI::App &sub, build_location &loc, bool with_deps);

// <deps_dir>/<deps_idx>, or an empty path when no --deps-dir was given.
std::filesystem::path dep_dir_for(build_location const &loc);

project make_project(build_location const &loc);

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path);

}  // namespace dotres
