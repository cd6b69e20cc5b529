#include "cmd_main_path.h"

#include "project.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace dotres {

void cmd_main_path::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("main-path", "Print the file that defines the app") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  add_build_location_options(*sub, cfg_ptr->loc, false);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_main_path::cmd_main_path(cmd_main_path::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_main_path::execute() {
  auto const main{ make_project(cfg_.loc).main_path() };
  if (main.empty()) {
    tui::debug("No project found under %s", cfg_.loc.build_dir.string().c_str());
    return;
  }
  tui::print_stdout("%s\n", main.string().c_str());
}

}  // namespace dotres
