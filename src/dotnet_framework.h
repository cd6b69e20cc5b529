#pragma once

#include "catalog.h"
#include "installer.h"
#include "util.h"

#include <filesystem>
#include <string>
#include <vector>

namespace dotres {

// Works out which shared framework versions an app needs and makes sure each is
// present under <dep_dir>/dotnet/shared/Microsoft.NETCore.App.
class dotnet_framework : unmovable {
 public:
  static constexpr char kComponent[]{ "dotnet-framework" };

  dotnet_framework(std::filesystem::path build_dir,
                   std::filesystem::path dep_dir,
                   catalog_provider const &catalog);

  // From the runtime config when the app is published, otherwise from the
  // versions restored under <dep_dir>/.nuget/packages/microsoft.netcore.app.
  std::vector<std::string> required_versions() const;

  // Hands every required version that is not already present to `inst`.
  void install(installer &inst) const;

  bool is_installed(std::string const &version) const;

  std::filesystem::path framework_dir() const;

 private:
  std::string resolve_patch(std::string const &version) const;
  std::vector<std::string> restored_versions() const;
  void install_version(installer &inst, std::string const &version) const;

  std::filesystem::path build_dir_;
  std::filesystem::path dep_dir_;
  catalog_provider const &catalog_;
};

}  // namespace dotres
