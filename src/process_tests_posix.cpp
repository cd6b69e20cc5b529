#if defined(_WIN32)
#error POSIX-only
#endif

#include "process.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct run_output {
  std::vector<std::string> out;
  std::vector<std::string> err;
  int exit_code{ -1 };
};

run_output run(std::vector<std::string> const &argv,
               dotres::process_env_t env = dotres::process_getenv()) {
  run_output r;
  dotres::process_run_cfg const cfg{
    .on_output_line =
        [&r](dotres::process_stream s, std::string_view line) {
          (s == dotres::process_stream::std_out ? r.out : r.err).emplace_back(line);
        },
    .env = std::move(env)
  };
  r.exit_code = dotres::process_run(argv, cfg);
  return r;
}

}  // namespace

TEST_CASE("process_run splits stdout and stderr into lines") {
  auto const r{ run({ "/bin/sh", "-c", "echo one; echo two; echo oops >&2" }) };
  CHECK(r.exit_code == 0);
  CHECK(r.out == std::vector<std::string>{ "one", "two" });
  CHECK(r.err == std::vector<std::string>{ "oops" });
}

TEST_CASE("process_run strips carriage returns and keeps an unterminated line") {
  auto const r{ run({ "/bin/sh", "-c", "printf 'a\\r\\nb'" }) };
  CHECK(r.out == std::vector<std::string>{ "a", "b" });
}

TEST_CASE("process_run passes arguments verbatim") {
  auto const r{ run({ "/bin/sh", "-c", "printf '%s\\n' \"$1\" \"$2\"", "sh", "a b", "" }) };
  CHECK(r.out == std::vector<std::string>{ "a b", "" });
}

TEST_CASE("process_run exit codes") {
  CHECK(run({ "/bin/sh", "-c", "exit 3" }).exit_code == 3);
  CHECK(run({ "/bin/sh", "-c", "kill -9 $$" }).exit_code == 128 + 9);
  CHECK(run({ "/nonexistent/installer" }).exit_code == 127);
}

TEST_CASE("process_run uses only the given environment") {
  dotres::process_env_t env{ { "DOTRES_PROCESS_TEST", "ok" }, { "PATH", "/usr/bin:/bin" } };
  auto const r{ run({ "sh", "-c", "printf '%s|%s\\n' \"$DOTRES_PROCESS_TEST\" \"${HOME-none}\"" },
                    env) };
  CHECK(r.out == std::vector<std::string>{ "ok|none" });
}

TEST_CASE("process_find_executable") {
  dotres::process_env_t const env{ { "PATH", "/nonexistent:/bin:/usr/bin" } };
  CHECK(fs::equivalent(dotres::process_find_executable("sh", env), "/bin/sh"));
  CHECK(dotres::process_find_executable("./relative/tool", env) == "./relative/tool");
  CHECK_THROWS_AS(dotres::process_find_executable("dotres-no-such-program", env),
                  std::runtime_error);
  CHECK_THROWS_AS(dotres::process_run({}, {}), std::invalid_argument);
}
