#include "test_support.h"

#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>

namespace dotres::test {

namespace fs = std::filesystem;

temp_dir_fixture::temp_dir_fixture() {
  static std::mt19937_64 rng{ std::random_device{}() };
  root = fs::temp_directory_path() / ("dotres-test-" + std::to_string(rng()));
  fs::create_directories(root);
}

temp_dir_fixture::~temp_dir_fixture() {
  std::error_code ec;
  fs::remove_all(root, ec);
}

fs::path temp_dir_fixture::write(fs::path const &rel, std::string_view content) const {
  auto const path{ root / rel };
  fs::create_directories(path.parent_path());
  std::ofstream out{ path, std::ios::binary };
  if (!out) { throw std::runtime_error("failed to create " + path.string()); }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return path;
}

fs::path temp_dir_fixture::mkdir(fs::path const &rel) const {
  auto const path{ root / rel };
  fs::create_directories(path);
  return path;
}

scoped_env::scoped_env(char const *name, char const *value) : name_{ name } {
  if (char const *old{ std::getenv(name) }) {
    old_ = old;
    had_old_ = true;
  }
  if (value) {
    ::setenv(name, value, 1);
  } else {
    ::unsetenv(name);
  }
}

scoped_env::~scoped_env() {
  if (had_old_) {
    ::setenv(name_.c_str(), old_.c_str(), 1);
  } else {
    ::unsetenv(name_.c_str());
  }
}

}  // namespace dotres::test
