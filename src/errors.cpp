#include "errors.h"

#include <utility>

namespace dotres {

namespace {

std::string describe_candidates(std::vector<std::filesystem::path> const &candidates) {
  std::string result{ "[" };
  for (size_t i{ 0 }; i < candidates.size(); ++i) {
    if (i > 0) { result += " "; }
    result += candidates[i].string();
  }
  result += "]";
  return result;
}

}  // namespace

ambiguous_project_error::ambiguous_project_error(
    std::vector<std::filesystem::path> candidates)
    : std::runtime_error{ "Multiple paths: " + describe_candidates(candidates) +
                          " contain a project file, but no .deployment file was used" },
      candidates_{ std::move(candidates) } {}

no_matching_version_error::no_matching_version_error(std::string constraint,
                                                     std::size_t catalog_size)
    : std::runtime_error{ "no match found for " + constraint + " in " +
                          std::to_string(catalog_size) + " available versions" },
      constraint_{ std::move(constraint) },
      catalog_size_{ catalog_size } {}

}  // namespace dotres
