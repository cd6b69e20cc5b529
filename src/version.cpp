#include "version.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include "semver.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dotres {

namespace {

constexpr std::size_t kCoreSegments{ 3 };

bool is_wildcard(std::string_view segment) {
  return segment == "x" || segment == "X" || segment == "*";
}

std::optional<std::uint64_t> parse_number(std::string_view s) {
  if (s.empty()) { return std::nullopt; }
  std::uint64_t value{ 0 };
  auto const [ptr, ec]{ std::from_chars(s.data(), s.data() + s.size(), value) };
  if (ec != std::errc{} || ptr != s.data() + s.size()) { return std::nullopt; }
  return value;
}

// "1.2.3-rc.1+build" -> "1.2.3"
std::string_view core_of(std::string_view text) {
  return text.substr(0, text.find_first_of("-+"));
}

struct parsed_constraint {
  std::array<std::optional<std::uint64_t>, kCoreSegments> core;  // nullopt = wildcard
  bool wildcard{ false };
  semver::version<> exact;  // valid only when !wildcard
};

parsed_constraint parse_constraint(std::string_view text) {
  text = util_trim(text);
  if (text.empty()) { throw std::invalid_argument("version constraint is empty"); }

  auto const segments{ util_split(core_of(text), '.') };
  if (segments.size() > kCoreSegments) {
    throw std::invalid_argument("version constraint has too many segments: " +
                                std::string{ text });
  }

  parsed_constraint result;
  for (size_t i{ 0 }; i < segments.size(); ++i) {
    if (is_wildcard(segments[i])) {
      result.wildcard = true;
      continue;
    }
    auto const number{ parse_number(segments[i]) };
    if (!number) {
      throw std::invalid_argument("invalid version constraint: " + std::string{ text });
    }
    result.core[i] = *number;
  }
  if (segments.size() < kCoreSegments) { result.wildcard = true; }

  if (!result.wildcard && !semver::parse(text, result.exact)) {
    throw std::invalid_argument("invalid version constraint: " + std::string{ text });
  }

  return result;
}

struct candidate {
  std::string text;
  semver::version<> version;
  std::array<std::uint64_t, kCoreSegments> core{};
  bool prerelease{ false };
};

std::optional<candidate> parse_candidate(std::string const &text) {
  candidate c{ .text = text };
  auto const trimmed{ util_trim(text) };
  if (!semver::parse(trimmed, c.version)) { return std::nullopt; }

  auto const segments{ util_split(core_of(trimmed), '.') };
  if (segments.size() != kCoreSegments) { return std::nullopt; }
  for (size_t i{ 0 }; i < kCoreSegments; ++i) {
    auto const number{ parse_number(segments[i]) };
    if (!number) { return std::nullopt; }
    c.core[i] = *number;
  }

  auto const without_build{ trimmed.substr(0, trimmed.find('+')) };
  c.prerelease = without_build.find('-') != std::string_view::npos;
  return c;
}

bool matches(parsed_constraint const &k, candidate const &c) {
  if (!k.wildcard) { return c.version == k.exact; }
  if (c.prerelease) { return false; }

  for (size_t i{ 0 }; i < kCoreSegments; ++i) {
    if (k.core[i] && *k.core[i] != c.core[i]) { return false; }
  }
  return true;
}

}  // namespace

std::vector<std::string> version_resolve_all(std::string_view constraint,
                                             std::vector<std::string> const &catalog) {
  auto const k{ parse_constraint(constraint) };

  std::vector<candidate> survivors;
  for (auto const &entry : catalog) {
    auto c{ parse_candidate(entry) };
    if (!c) {
      tui::debug("Ignoring unparseable version '%s'", entry.c_str());
      continue;
    }
    if (matches(k, *c)) { survivors.push_back(std::move(*c)); }
  }

  std::stable_sort(survivors.begin(),
                   survivors.end(),
                   [](candidate const &a, candidate const &b) { return a.version > b.version; });

  std::vector<std::string> result;
  result.reserve(survivors.size());
  for (auto &c : survivors) { result.push_back(std::move(c.text)); }
  return result;
}

std::string version_resolve(std::string_view constraint,
                            std::vector<std::string> const &catalog) {
  auto matches{ version_resolve_all(constraint, catalog) };
  if (matches.empty()) {
    throw no_matching_version_error{ std::string{ constraint }, catalog.size() };
  }
  return std::move(matches.front());
}

}  // namespace dotres
