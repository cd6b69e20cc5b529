#include "cmd_required_versions.h"

#include "dotnet_framework.h"
#include "manifest.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace dotres {

void cmd_required_versions::register_cli(CLI::App &app,
                                         std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("required-versions",
                                "Print the framework versions the app needs") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  add_build_location_options(*sub, cfg_ptr->loc, true);
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to the dependency catalog");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_required_versions::cmd_required_versions(cmd_required_versions::cfg cfg)
    : cfg_{ std::move(cfg) } {}

void cmd_required_versions::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  dotnet_framework const framework{ std::filesystem::absolute(cfg_.loc.build_dir),
                                    dep_dir_for(cfg_.loc),
                                    *m };

  for (auto const &v : framework.required_versions()) {
    tui::print_stdout("%s\n", v.c_str());
  }
}

}  // namespace dotres
