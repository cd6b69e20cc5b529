#include "platform.h"

#include <system_error>

namespace dotres::platform {

bool file_exists(std::filesystem::path const &path) {
  std::error_code ec;
  bool const exists{ std::filesystem::exists(path, ec) };
  if (ec) { throw std::filesystem::filesystem_error("file_exists", path, ec); }
  return exists;
}

void make_executable(std::filesystem::path const &path) {
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_exec |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::add);
}

}  // namespace dotres::platform
