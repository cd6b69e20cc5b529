#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace dotres {

// More than one *.runtimeconfig.json at the build root.
struct ambiguous_runtime_config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Several project files and no .deployment hint to pick one.
class ambiguous_project_error : public std::runtime_error {
 public:
  explicit ambiguous_project_error(std::vector<std::filesystem::path> candidates);

  std::vector<std::filesystem::path> const &candidates() const { return candidates_; }

 private:
  std::vector<std::filesystem::path> candidates_;
};

class no_matching_version_error : public std::runtime_error {
 public:
  no_matching_version_error(std::string constraint, std::size_t catalog_size);

  std::string const &constraint() const { return constraint_; }
  std::size_t catalog_size() const { return catalog_size_; }

 private:
  std::string constraint_;
  std::size_t catalog_size_;
};

struct malformed_descriptor_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct runtime_config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct deployment_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct install_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace dotres
