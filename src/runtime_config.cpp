#include "runtime_config.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include "picojson.h"

#include <algorithm>
#include <string>
#include <vector>

namespace dotres {

namespace {

picojson::object const *get_object(picojson::object const &parent,
                                   char const *key,
                                   char const *context) {
  auto const it{ parent.find(key) };
  if (it == parent.end() || it->second.is<picojson::null>()) { return nullptr; }
  if (!it->second.is<picojson::object>()) {
    throw runtime_config_error(std::string{ context } + " must be an object");
  }
  return &it->second.get<picojson::object>();
}

std::string get_string(picojson::object const &parent,
                       char const *key,
                       char const *context) {
  auto const it{ parent.find(key) };
  if (it == parent.end() || it->second.is<picojson::null>()) { return {}; }
  if (!it->second.is<std::string>()) {
    throw runtime_config_error(std::string{ context } + " must be a string");
  }
  return it->second.get<std::string>();
}

}  // namespace

runtime_config runtime_config_parse(std::string_view json) {
  picojson::value root;
  std::string const json_str{ json };
  if (std::string const err{ picojson::parse(root, json_str) }; !err.empty()) {
    throw runtime_config_error("invalid runtime config JSON: " + err);
  }
  if (!root.is<picojson::object>()) {
    throw runtime_config_error("runtime config must be a JSON object");
  }

  runtime_config result;
  auto const *options{
    get_object(root.get<picojson::object>(), "runtimeOptions", "runtimeOptions")
  };
  if (!options) { return result; }

  if (auto const *framework{
          get_object(*options, "framework", "runtimeOptions.framework") }) {
    result.framework_name = get_string(*framework, "name", "runtimeOptions.framework.name");
    result.framework_version =
        get_string(*framework, "version", "runtimeOptions.framework.version");
  }

  if (auto const it{ options->find("applyPatches") };
      it != options->end() && !it->second.is<picojson::null>()) {
    if (!it->second.is<bool>()) {
      throw runtime_config_error("runtimeOptions.applyPatches must be a boolean");
    }
    result.apply_patches = it->second.get<bool>();
  }

  return result;
}

runtime_config runtime_config_load(std::filesystem::path const &path) {
  tui::debug("Reading runtime config %s", path.string().c_str());
  try {
    return runtime_config_parse(util_load_file(path));
  } catch (runtime_config_error const &e) {
    throw runtime_config_error(path.string() + ": " + e.what());
  }
}

std::filesystem::path runtime_config_find(std::filesystem::path const &build_dir) {
  constexpr std::string_view kSuffix{ ".runtimeconfig.json" };

  std::vector<std::filesystem::path> configs;
  for (auto const &entry : std::filesystem::directory_iterator{ build_dir }) {
    if (entry.is_regular_file() && entry.path().filename().string().ends_with(kSuffix)) {
      configs.push_back(entry.path());
    }
  }

  if (configs.empty()) { return {}; }
  if (configs.size() > 1) {
    std::sort(configs.begin(), configs.end());
    std::string names;
    for (auto const &c : configs) { names += " " + c.filename().string(); }
    throw ambiguous_runtime_config_error("Multiple .runtimeconfig.json files present:" +
                                         names);
  }
  return configs.front();
}

}  // namespace dotres
