#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace dotres {

// Installs every required framework version missing from <dep_dir>/dotnet.
class cmd_install_framework : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_install_framework> {
    build_location loc;
    std::optional<std::filesystem::path> manifest_path;
    std::optional<std::filesystem::path> installer_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_install_framework(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace dotres
