#include "project.h"

#include "errors.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

constexpr char kDepsIdx[]{ "9" };

struct project_fixture : dotres::test::temp_dir_fixture {
  project_fixture()
      : build_dir{ mkdir("build") },
        dep_dir{ mkdir(fs::path{ "deps" } / kDepsIdx) },
        subject{ build_dir, dep_dir, kDepsIdx } {}

  void write_build(fs::path const &rel, std::string const &content = {}) const {
    write(fs::path{ "build" } / rel, content);
  }

  void write_publish(fs::path const &rel) const {
    write(fs::path{ "deps" } / kDepsIdx / "dotnet_publish" / rel, "");
  }

  void write_mixed_tree() const {
    for (char const *name : { "first.csproj",
                              "other.txt",
                              "dir/second.csproj",
                              ".cloudfoundry/other.csproj",
                              "a/.cloudfoundry/x.csproj",
                              "dir/other.txt",
                              "a/b/first.vbproj",
                              "b/c/first.fsproj",
                              "c/d/other.txt" }) {
      write_build(name);
    }
  }

  fs::path build_dir;
  fs::path dep_dir;
  dotres::project subject;
};

}  // namespace

TEST_CASE_FIXTURE(project_fixture, "project::proj_file_paths skips .cloudfoundry") {
  write_mixed_tree();

  std::vector<fs::path> const expected{
    build_dir / "a" / "b" / "first.vbproj",
    build_dir / "b" / "c" / "first.fsproj",
    build_dir / "dir" / "second.csproj",
    build_dir / "first.csproj",
  };
  CHECK(subject.proj_file_paths() == expected);
}

TEST_CASE_FIXTURE(project_fixture, "project::proj_file_paths prunes .cloudfoundry at any depth") {
  write_build("app/app.csproj");
  write_build("app/.cloudfoundry/cached.csproj");
  write_build("app/src/.cloudfoundry/deep/cached.fsproj");
  write_build("app/src/lib.cloudfoundry/kept.vbproj");

  std::vector<fs::path> const expected{
    build_dir / "app" / "app.csproj",
    build_dir / "app" / "src" / "lib.cloudfoundry" / "kept.vbproj",
  };
  CHECK(subject.proj_file_paths() == expected);
}

TEST_CASE_FIXTURE(project_fixture, "project::proj_file_paths ignores look-alike names") {
  write_build("app.csproj.bak");
  write_build("app.CSPROJ");
  write_build("notes/csproj");
  mkdir("build/dir.fsproj");

  CHECK(subject.proj_file_paths().empty());
}

TEST_CASE_FIXTURE(project_fixture, "project::is_published") {
  SUBCASE("runtime config at the root") {
    write_build("fred.runtimeconfig.json");
    CHECK(subject.is_published());
  }

  SUBCASE("runtime config only in a subdirectory") {
    write_build("bin/fred.runtimeconfig.json");
    CHECK_FALSE(subject.is_published());
  }

  SUBCASE("no runtime config") {
    write_build("first.csproj");
    CHECK_FALSE(subject.is_published());
  }
}

TEST_CASE_FIXTURE(project_fixture, "project::runtime_config_file rejects duplicates") {
  write_build("fred.runtimeconfig.json");
  write_build("barney.runtimeconfig.json");

  CHECK_THROWS_WITH_AS(subject.runtime_config_file(),
                       doctest::Contains("Multiple .runtimeconfig.json files present"),
                       dotres::ambiguous_runtime_config_error);
  CHECK_THROWS_AS(subject.main_path(), dotres::ambiguous_runtime_config_error);
}

TEST_CASE_FIXTURE(project_fixture, "project::main_path") {
  SUBCASE("runtime config wins") {
    write_build("fred.runtimeconfig.json");
    write_build("subdir/first.csproj");
    CHECK(subject.main_path() == build_dir / "fred.runtimeconfig.json");
  }

  SUBCASE("nothing to run") { CHECK(subject.main_path().empty()); }

  SUBCASE("exactly one project") {
    write_build("subdir/first.csproj");
    CHECK(subject.main_path() == build_dir / "subdir" / "first.csproj");
  }

  SUBCASE("several projects chosen by .deployment") {
    write_mixed_tree();
    write_build(".deployment", "[config]\nproject = ./a/b/first.vbproj");
    CHECK(subject.main_path() == build_dir / "a" / "b" / "first.vbproj");
  }

  SUBCASE(".deployment path without leading dot") {
    write_mixed_tree();
    write_build(".deployment", "[config]\nproject = dir/second.csproj\n");
    CHECK(subject.main_path() == build_dir / "dir" / "second.csproj");
  }

  SUBCASE(".deployment cannot escape the build dir") {
    write_mixed_tree();
    write_build(".deployment", "[config]\nproject = ../first.csproj\n");
    CHECK(subject.main_path() == build_dir / "first.csproj");
  }

  SUBCASE(".deployment path climbing out through a subdirectory") {
    write_mixed_tree();
    write("outside.csproj", "");
    write_build(".deployment", "[config]\nproject = a/../../outside.csproj\n");
    CHECK_THROWS_AS(subject.main_path(), dotres::deployment_error);
    CHECK_THROWS_AS(subject.start_command(), dotres::deployment_error);
  }

  SUBCASE(".deployment naming the build dir itself") {
    write_mixed_tree();
    write_build(".deployment", "[config]\nproject = a/..\n");
    CHECK_THROWS_AS(subject.main_path(), dotres::deployment_error);
  }

  SUBCASE("several projects without .deployment") {
    write_mixed_tree();
    try {
      (void)subject.main_path();
      FAIL("expected ambiguous_project_error");
    } catch (dotres::ambiguous_project_error const &e) {
      CHECK(e.candidates().size() == 4);
      CHECK(std::string{ e.what() }.find("no .deployment file was used") != std::string::npos);
    }
  }

  SUBCASE("several projects with an unusable .deployment") {
    write_mixed_tree();
    write_build(".deployment", "[other]\nkey = value\n");
    CHECK_THROWS_AS(subject.main_path(), dotres::deployment_error);
  }
}

TEST_CASE_FIXTURE(project_fixture, "project::start_command for a published app") {
  write_build("fred.runtimeconfig.json");

  SUBCASE("native executable") {
    write_build("fred");
    CHECK(subject.start_command() == (fs::path{ "${HOME}" } / "fred").string());

    auto const perms{ fs::status(build_dir / "fred").permissions() };
    CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
    CHECK((perms & fs::perms::others_exec) != fs::perms::none);
  }

  SUBCASE("dll only") {
    write_build("fred.dll");
    CHECK(subject.start_command() == (fs::path{ "${HOME}" } / "fred.dll").string());
  }

  SUBCASE("executable preferred over dll") {
    write_build("fred");
    write_build("fred.dll");
    CHECK(subject.start_command() == (fs::path{ "${HOME}" } / "fred").string());
  }

  SUBCASE("neither") { CHECK(subject.start_command().empty()); }
}

TEST_CASE_FIXTURE(project_fixture, "project::start_command for a source app") {
  auto const publish_root{ fs::path{ "${DEPS_DIR}" } / kDepsIdx / "dotnet_publish" };

  SUBCASE("no AssemblyName") {
    write_build("subdir/fred.csproj", "<Project></Project>");
    mkdir(fs::path{ "deps" } / kDepsIdx / "dotnet_publish");

    SUBCASE("native executable") {
      write_publish("fred");
      CHECK(subject.start_command() == (publish_root / "fred").string());
    }

    SUBCASE("dll only") {
      write_publish("fred.dll");
      CHECK(subject.start_command() == (publish_root / "fred.dll").string());
    }

    SUBCASE("neither") { CHECK(subject.start_command().empty()); }
  }

  SUBCASE("AssemblyName overrides the file name") {
    write_build("subdir/fred.csproj", R"(
<Project Sdk="Microsoft.NET.Sdk.Web">
	<PropertyGroup>
		<AssemblyName>f.red.csproj</AssemblyName>
	</PropertyGroup>
</Project>)");
    write_publish("f.red");

    CHECK(subject.start_command() == (publish_root / "f.red").string());
  }

  SUBCASE("malformed project file") {
    write_build("subdir/fred.csproj", "<Project><PropertyGroup></Project>");
    CHECK_THROWS_AS(subject.start_command(), dotres::malformed_descriptor_error);
  }
}

TEST_CASE_FIXTURE(project_fixture, "project::start_command with no project") {
  mkdir(fs::path{ "deps" } / kDepsIdx / "dotnet_publish");
  CHECK(subject.start_command().empty());
}
