#pragma once

#include "catalog.h"

#include <filesystem>

namespace dotres {

// Places one dependency under a destination directory. Implementations report
// failure by throwing; callers never retry.
class installer {
 public:
  virtual ~installer() = default;

  virtual void install_dependency(dependency const &dep,
                                  std::filesystem::path const &dest) = 0;
};

}  // namespace dotres
