#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dotres {

using process_env_t = std::unordered_map<std::string, std::string>;

enum class process_stream { std_out, std_err };

struct process_run_cfg {
  // Once per line with the newline (and a trailing '\r') removed. An unterminated
  // last line is delivered when its stream closes.
  std::function<void(process_stream, std::string_view)> on_output_line;
  process_env_t env;
};

process_env_t process_getenv();

// Resolves a bare program name against PATH from `env`. Names containing a slash
// are returned unchanged. Throws std::runtime_error if nothing is found.
std::filesystem::path process_find_executable(std::string_view program,
                                              process_env_t const &env);

// Runs argv[0] with stdin on /dev/null and blocks until it exits. Returns the exit
// code; a child killed by a signal reports 128 + signal, one that could not be
// exec'd reports 127.
int process_run(std::vector<std::string> const &argv, process_run_cfg const &cfg);

}  // namespace dotres
