#include "sol_util.h"

#include <stdexcept>
#include <utility>

namespace dotres {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  return lua;
}

std::optional<std::string> sol_util_get_optional_string(sol::table const &table,
                                                        std::string_view key,
                                                        std::string_view context) {
  sol::object const obj = table[key];
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return std::nullopt; }

  if (obj.get_type() != sol::type::string) {
    throw std::runtime_error(std::string{ context } + ": " + std::string{ key } +
                             " must be a string, got " +
                             std::string{ sol::type_name(table.lua_state(), obj.get_type()) });
  }
  return obj.as<std::string>();
}

std::string sol_util_get_required_string(sol::table const &table,
                                         std::string_view key,
                                         std::string_view context) {
  auto value{ sol_util_get_optional_string(table, key, context) };
  if (!value) {
    throw std::runtime_error(std::string{ context } + ": " + std::string{ key } +
                             " is required");
  }
  return std::move(*value);
}

}  // namespace dotres
