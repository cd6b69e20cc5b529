#pragma once

#include "installer.h"

#include <filesystem>
#include <optional>

namespace dotres {

// Delegates to an external program, run as
//
//   <program> <name> <version> <dest>
//
// with DOTRES_DEPENDENCY_URI and DOTRES_DEPENDENCY_SHA256 exported when the catalog
// entry carries them. The program's output goes to the log line by line.
class shell_installer : public installer {
 public:
  explicit shell_installer(std::filesystem::path program);

  // Explicit path if given, else $DOTRES_INSTALLER. Throws if neither is set.
  static std::filesystem::path find_program(
      std::optional<std::filesystem::path> const &explicit_path);

  void install_dependency(dependency const &dep, std::filesystem::path const &dest) override;

  std::filesystem::path const &program() const { return program_; }

 private:
  std::filesystem::path program_;
};

}  // namespace dotres
