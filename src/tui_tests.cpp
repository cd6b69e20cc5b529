#include "tui.h"

#include "doctest.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct tui_capture {
  tui_capture() {
    dotres::tui::set_output_handler([this](std::string_view s) { log.emplace_back(s); });
    dotres::tui::set_result_handler([this](std::string_view s) { results.append(s); });
  }

  ~tui_capture() {
    dotres::tui::set_output_handler([](std::string_view) {});
    dotres::tui::set_result_handler({});
  }

  std::vector<std::string> log;
  std::string results;
};

}  // namespace

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(dotres::tui::init(), std::logic_error);
}

TEST_CASE("tui run and shutdown must pair up") {
  CHECK_NOTHROW(dotres::tui::run());
  CHECK_THROWS_AS(dotres::tui::run(), std::logic_error);
  CHECK_NOTHROW(dotres::tui::shutdown());
  CHECK_THROWS_AS(dotres::tui::shutdown(), std::logic_error);
}

TEST_CASE_FIXTURE(tui_capture, "tui idle logging is unfiltered and undecorated") {
  dotres::tui::debug("hello %s", "world");
  dotres::tui::error("code %d", 3);

  CHECK(log == std::vector<std::string>{ "hello world\n", "code 3\n" });
}

TEST_CASE_FIXTURE(tui_capture, "tui default verbosity hides debug lines") {
  dotres::tui::scope s{ dotres::tui::level::TUI_INFO, false };
  dotres::tui::debug("Main path %s chosen by .deployment", "/b/a.csproj");
  dotres::tui::info("Required dotnetframework versions: [%s]", "2.0.9");
  dotres::tui::warn("careful");

  CHECK(log == std::vector<std::string>{ "Required dotnetframework versions: [2.0.9]\n",
                                         "careful\n" });
}

TEST_CASE_FIXTURE(tui_capture, "tui verbose logging is decorated") {
  {
    dotres::tui::scope s{ dotres::tui::level::TUI_DEBUG, true };
    dotres::tui::debug("resolved");
    dotres::tui::error("failed");
  }

  REQUIRE(log.size() == 2);
  CHECK(log[0].starts_with("["));
  CHECK(log[0].find("] [DBG] resolved\n") != std::string::npos);
  CHECK(log[1].find("] [ERR] failed\n") != std::string::npos);
}

TEST_CASE_FIXTURE(tui_capture, "tui scope end restores idle logging") {
  {
    dotres::tui::scope s{ dotres::tui::level::TUI_ERROR, true };
    dotres::tui::info("dropped");
  }
  dotres::tui::info("kept");

  CHECK(log == std::vector<std::string>{ "kept\n" });
}

TEST_CASE_FIXTURE(tui_capture, "tui results bypass the log") {
  dotres::tui::scope s{ dotres::tui::level::TUI_ERROR, true };
  dotres::tui::print_stdout("%s\n", "${HOME}/app");

  CHECK(results == "${HOME}/app\n");
  CHECK(log.empty());
}

TEST_CASE_FIXTURE(tui_capture, "tui long messages are not truncated") {
  std::string const long_value(4000, 'x');
  dotres::tui::info("%s", long_value.c_str());
  dotres::tui::print_stdout("%s", long_value.c_str());

  REQUIRE(log.size() == 1);
  CHECK(log[0] == long_value + "\n");
  CHECK(results == long_value);
}
