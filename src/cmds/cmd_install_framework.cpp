#include "cmd_install_framework.h"

#include "dotnet_framework.h"
#include "manifest.h"
#include "shell_installer.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace dotres {

void cmd_install_framework::register_cli(CLI::App &app,
                                         std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("install-framework",
                                "Install missing framework versions into the deps dir") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  add_build_location_options(*sub, cfg_ptr->loc, true);
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to the dependency catalog");
  sub->add_option("--installer",
                  cfg_ptr->installer_path,
                  "Program run as <program> <name> <version> <dest>");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_install_framework::cmd_install_framework(cmd_install_framework::cfg cfg)
    : cfg_{ std::move(cfg) } {}

void cmd_install_framework::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  shell_installer inst{ shell_installer::find_program(cfg_.installer_path) };
  tui::debug("Using installer %s", inst.program().string().c_str());

  dotnet_framework const framework{ std::filesystem::absolute(cfg_.loc.build_dir),
                                    dep_dir_for(cfg_.loc),
                                    *m };
  framework.install(inst);
}

}  // namespace dotres
