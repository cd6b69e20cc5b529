#pragma once

#include "cmds/cmd_install_framework.h"
#include "cmds/cmd_main_path.h"
#include "cmds/cmd_required_versions.h"
#include "cmds/cmd_resolve.h"
#include "cmds/cmd_start_command.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace dotres {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_install_framework::cfg,
                                 cmd_main_path::cfg,
                                 cmd_required_versions::cfg,
                                 cmd_resolve::cfg,
                                 cmd_start_command::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace dotres
