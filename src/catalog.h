#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dotres {

struct dependency {
  std::string name;
  std::string version;
  std::optional<std::string> uri;     // forwarded to the installer, never fetched here
  std::optional<std::string> sha256;
};

// Source of "which versions of X exist". Injected into anything that resolves
// version constraints so tests can substitute fixture catalogs.
class catalog_provider {
 public:
  virtual ~catalog_provider() = default;

  // Every version declared for `name`, in declaration order.
  virtual std::vector<std::string> all_versions(std::string_view name) const = 0;

  virtual std::optional<dependency> find(std::string_view name,
                                         std::string_view version) const = 0;
};

}  // namespace dotres
