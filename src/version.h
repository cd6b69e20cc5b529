#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dotres {

// Constraints are dot-separated; any segment may be the wildcard "x" ("X" and "*" are
// accepted too) and missing trailing segments are wildcards. "6.0.x" matches the
// highest 6.0 patch release. A constraint without wildcards must equal a candidate.
// Candidates that are not semantic versions are ignored. Pre-release candidates only
// match a wildcard-free constraint.

// Highest matching version. Throws no_matching_version_error if nothing matches and
// std::invalid_argument if the constraint itself is malformed.
std::string version_resolve(std::string_view constraint,
                            std::vector<std::string> const &catalog);

// Every match, highest precedence first. Empty if nothing matches.
std::vector<std::string> version_resolve_all(std::string_view constraint,
                                             std::vector<std::string> const &catalog);

}  // namespace dotres
