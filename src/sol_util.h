#pragma once

#include "sol/sol.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dotres {

using sol_state_ptr = std::unique_ptr<sol::state>;
sol_state_ptr sol_util_make_lua_state();  // base, string, table and math only

// Reads table[key] as a string. Nil is nullopt; any other non-string value throws
// std::runtime_error prefixed with `context`.
std::optional<std::string> sol_util_get_optional_string(sol::table const &table,
                                                        std::string_view key,
                                                        std::string_view context);

std::string sol_util_get_required_string(sol::table const &table,
                                         std::string_view key,
                                         std::string_view context);

}  // namespace dotres
