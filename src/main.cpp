#include "cli.h"
#include "errors.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  dotres::tui::init();

  auto args{ dotres::cli_parse(argc, argv) };
  dotres::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      dotres::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    dotres::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return dotres::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (dotres::ambiguous_project_error const &ex) {
    dotres::tui::error("Execution failed: %s", ex.what());
    for (auto const &p : ex.candidates()) { dotres::tui::info("  %s", p.string().c_str()); }
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    dotres::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
