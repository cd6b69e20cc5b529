#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>

namespace CLI { class App; }

namespace dotres {

// Prints the file that defines the app: the runtime config, the only project
// file, or the project named by .deployment. Prints nothing for an empty tree.
class cmd_main_path : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_main_path> {
    build_location loc;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_main_path(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace dotres
