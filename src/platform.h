#pragma once

#include <filesystem>

namespace dotres::platform {

// False when nothing exists at `path`; throws filesystem_error when the answer
// cannot be determined (permission denied on a parent, etc).
bool file_exists(std::filesystem::path const &path);

// Adds owner, group and other execute bits. Throws filesystem_error on failure.
void make_executable(std::filesystem::path const &path);

}  // namespace dotres::platform
