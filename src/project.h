#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace dotres {

// A build directory plus the dependency staging directory it publishes into.
//
// Decides which project is the application (main_path) and how to launch it
// (start_command). Nothing here writes to the build dir except the execute bit
// repair in start_command.
class project {
 public:
  // `dep_dir` is <deps_dir>/<deps_idx>; `deps_idx` is only used to build the
  // ${DEPS_DIR}-relative start command.
  project(std::filesystem::path build_dir, std::filesystem::path dep_dir, std::string deps_idx);

  // Every *.csproj, *.vbproj and *.fsproj under the build dir, sorted. The
  // .cloudfoundry directory is never descended into.
  std::vector<std::filesystem::path> proj_file_paths() const;

  // The single *.runtimeconfig.json at the build root, or an empty path.
  // Throws ambiguous_runtime_config_error if there is more than one.
  std::filesystem::path runtime_config_file() const;

  bool is_published() const;

  // Runtime config if present, else the only project file, else the project named
  // by .deployment, which must lie inside the build dir. Empty when the tree holds
  // no project at all.
  std::filesystem::path main_path() const;

  // Path to launch, relative to ${HOME} when published and to
  // ${DEPS_DIR}/<idx>/dotnet_publish otherwise. Empty when nothing runnable exists.
  std::string start_command() const;

  std::filesystem::path const &build_dir() const { return build_dir_; }
  std::filesystem::path const &dep_dir() const { return dep_dir_; }

 private:
  std::string base_name(std::filesystem::path const &main) const;
  std::string published_start_command(std::string const &base) const;

  std::filesystem::path build_dir_;
  std::filesystem::path dep_dir_;
  std::string deps_idx_;
};

}  // namespace dotres
