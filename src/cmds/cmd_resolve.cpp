#include "cmd_resolve.h"

#include "cmd_common.h"
#include "manifest.h"
#include "tui.h"
#include "version.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace dotres {

void cmd_resolve::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("resolve", "Resolve a version constraint against the catalog") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("component", cfg_ptr->component, "Catalog entry name, e.g. dotnet-framework")
      ->required();
  sub->add_option("constraint", cfg_ptr->constraint, "Version constraint, e.g. 6.0.x")
      ->required();
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to the dependency catalog");
  sub->add_flag("--all", cfg_ptr->all, "Print every match, newest first");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_resolve::cmd_resolve(cmd_resolve::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_resolve::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const catalog{ m->all_versions(cfg_.component) };

  if (!cfg_.all) {
    tui::print_stdout("%s\n", version_resolve(cfg_.constraint, catalog).c_str());
    return;
  }

  for (auto const &v : version_resolve_all(cfg_.constraint, catalog)) {
    tui::print_stdout("%s\n", v.c_str());
  }
}

}  // namespace dotres
