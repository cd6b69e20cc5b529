#include "cmd_start_command.h"

#include "project.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace dotres {

void cmd_start_command::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("start-command", "Print the path that launches the app") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  add_build_location_options(*sub, cfg_ptr->loc, true);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_start_command::cmd_start_command(cmd_start_command::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_start_command::execute() {
  auto const command{ make_project(cfg_.loc).start_command() };
  if (command.empty()) {
    tui::warn("No runnable output found for app in %s", cfg_.loc.build_dir.string().c_str());
    return;
  }
  tui::print_stdout("%s\n", command.c_str());
}

}  // namespace dotres
