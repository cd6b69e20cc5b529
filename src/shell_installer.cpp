#include "shell_installer.h"

#include "errors.h"
#include "process.h"
#include "tui.h"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace dotres {

shell_installer::shell_installer(std::filesystem::path program)
    : program_{ std::move(program) } {}

std::filesystem::path shell_installer::find_program(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path && !explicit_path->empty()) { return *explicit_path; }
  if (char const *env{ std::getenv("DOTRES_INSTALLER") }; env && *env) { return env; }
  throw std::runtime_error("No installer program: pass --installer or set DOTRES_INSTALLER");
}

void shell_installer::install_dependency(dependency const &dep,
                                         std::filesystem::path const &dest) {
  tui::info("-----> Installing %s %s", dep.name.c_str(), dep.version.c_str());

  process_run_cfg cfg{ .on_output_line =
                           [](process_stream stream, std::string_view line) {
                             std::string const text{ line };
                             if (stream == process_stream::std_err) {
                               tui::warn("       %s", text.c_str());
                             } else {
                               tui::info("       %s", text.c_str());
                             }
                           },
                       .env = process_getenv() };
  cfg.env.erase("DOTRES_DEPENDENCY_URI");
  cfg.env.erase("DOTRES_DEPENDENCY_SHA256");
  if (dep.uri) { cfg.env["DOTRES_DEPENDENCY_URI"] = *dep.uri; }
  if (dep.sha256) { cfg.env["DOTRES_DEPENDENCY_SHA256"] = *dep.sha256; }

  std::filesystem::create_directories(dest);

  int exit_code{ 0 };
  try {
    exit_code = process_run({ program_.string(), dep.name, dep.version, dest.string() }, cfg);
  } catch (std::exception const &e) {
    throw install_error("failed to run installer " + program_.string() + ": " + e.what());
  }

  if (exit_code != 0) {
    throw install_error("installing " + dep.name + " " + dep.version + " failed: " +
                        program_.string() + " exited with " +
                        std::to_string(exit_code));
  }
}

}  // namespace dotres
