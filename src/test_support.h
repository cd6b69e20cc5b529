#pragma once

// Helpers shared by the unit tests. Linked into dotres_unit_tests only.

#include <filesystem>
#include <string>
#include <string_view>

namespace dotres::test {

// Creates a fresh directory under the system temp dir, removed on destruction.
struct temp_dir_fixture {
  temp_dir_fixture();
  ~temp_dir_fixture();

  // Writes `content` to root/rel, creating parent directories.
  std::filesystem::path write(std::filesystem::path const &rel, std::string_view content) const;
  std::filesystem::path mkdir(std::filesystem::path const &rel) const;

  std::filesystem::path root;
};

// Sets (or with nullptr, unsets) an environment variable for the current scope.
class scoped_env {
 public:
  scoped_env(char const *name, char const *value);
  ~scoped_env();

  scoped_env(scoped_env const &) = delete;
  scoped_env &operator=(scoped_env const &) = delete;

 private:
  std::string name_;
  std::string old_;
  bool had_old_{ false };
};

}  // namespace dotres::test
