#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace dotres {

// Resolves a version constraint against the catalog, e.g.
//
//   dotres resolve dotnet-framework 2.0.x  ->  2.0.9
class cmd_resolve : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_resolve> {
    std::string component;
    std::string constraint;
    std::optional<std::filesystem::path> manifest_path;
    bool all{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_resolve(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace dotres
