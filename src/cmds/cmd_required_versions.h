#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace dotres {

class cmd_required_versions : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_required_versions> {
    build_location loc;
    std::optional<std::filesystem::path> manifest_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_required_versions(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace dotres
