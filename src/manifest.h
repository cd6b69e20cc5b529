#pragma once

#include "catalog.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace dotres {

// Dependency catalog declared by a Lua script:
//
//   DEPENDENCIES = {
//     { name = "dotnet-framework", version = "6.0.5", uri = "...", sha256 = "..." },
//   }
struct manifest : catalog_provider, unmovable {
  std::vector<dependency> dependencies;
  std::filesystem::path manifest_path;

  manifest() = default;

  // Use the provided path if given, otherwise $DOTRES_MANIFEST. Returns an absolute
  // path or throws if neither names an existing file.
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::string_view script,
                                        std::filesystem::path const &manifest_path);

  std::vector<std::string> all_versions(std::string_view name) const override;
  std::optional<dependency> find(std::string_view name,
                                 std::string_view version) const override;
};

}  // namespace dotres
