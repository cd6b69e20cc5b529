#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dotres {

// The fields of a *.runtimeconfig.json this engine reads:
//
//   { "runtimeOptions": { "framework": { "name": ..., "version": ... },
//                         "applyPatches": true } }
struct runtime_config {
  std::string framework_name;
  std::string framework_version;  // empty when the file pins no version
  bool apply_patches{ true };     // absent means true
};

// Throws runtime_config_error on invalid JSON or wrongly typed fields. Missing
// objects and keys are not errors.
runtime_config runtime_config_parse(std::string_view json);
runtime_config runtime_config_load(std::filesystem::path const &path);

// The single *.runtimeconfig.json directly inside `build_dir`, or an empty path.
// Throws ambiguous_runtime_config_error if there is more than one.
std::filesystem::path runtime_config_find(std::filesystem::path const &build_dir);

}  // namespace dotres
