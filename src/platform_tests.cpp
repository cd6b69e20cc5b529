#include "platform.h"

#include "test_support.h"

#include "doctest.h"

#include <filesystem>

namespace dotres {

TEST_CASE_FIXTURE(test::temp_dir_fixture, "platform::file_exists") {
  CHECK_FALSE(platform::file_exists(root / "missing"));
  CHECK(platform::file_exists(write("present", "")));
  CHECK(platform::file_exists(mkdir("dir")));
}

#ifndef _WIN32
TEST_CASE_FIXTURE(test::temp_dir_fixture, "platform::make_executable adds exec bits") {
  auto const path{ write("tool", "#!/bin/sh\n") };
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace);

  platform::make_executable(path);

  auto const perms{ std::filesystem::status(path).permissions() };
  CHECK((perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none);
  CHECK((perms & std::filesystem::perms::group_exec) != std::filesystem::perms::none);
  CHECK((perms & std::filesystem::perms::others_exec) != std::filesystem::perms::none);
  CHECK((perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none);
}
#endif

TEST_CASE_FIXTURE(test::temp_dir_fixture, "platform::make_executable missing file throws") {
  CHECK_THROWS_AS(platform::make_executable(root / "missing"),
                  std::filesystem::filesystem_error);
}

}  // namespace dotres
