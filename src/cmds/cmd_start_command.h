#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>

namespace CLI { class App; }

namespace dotres {

// Prints the launch path relative to ${HOME} or ${DEPS_DIR}.
class cmd_start_command : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_start_command> {
    build_location loc;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_start_command(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace dotres
