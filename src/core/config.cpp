/// @file
/// @brief JSON config file loading for TonalConfig.

#include "core/config.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace tonal {

namespace {

/// @brief Read a boolean entry, warning when the type does not match.
void applyBool(const JsonValue& val, const std::string& name, bool& field) {
  if (val.type != JsonValue::Bool) {
    std::fprintf(stderr, "[Config] WARNING: \"%s\" must be true or false, ignored\n",
                 name.c_str());
    return;
  }
  field = val.bool_val;
}

}  // namespace

void applyConfigJson(const std::map<std::string, JsonValue>& entries, TonalConfig& config) {
  for (const auto& [name, val] : entries) {
    if (name == "tuning") {
      if (val.type != JsonValue::Number) {
        std::fprintf(stderr, "[Config] WARNING: \"tuning\" must be a number, ignored\n");
        continue;
      }
      config.tuning = val.number_val;
    } else if (name == "sharps") {
      applyBool(val, name, config.sharps);
    } else if (name == "json") {
      applyBool(val, name, config.json_output);
    } else if (name == "verbose") {
      applyBool(val, name, config.verbose);
    } else {
      std::fprintf(stderr, "[Config] WARNING: unknown key \"%s\", ignored\n", name.c_str());
    }
  }
}

bool validateConfig(const TonalConfig& config, std::string& error) {
  if (!std::isfinite(config.tuning) || config.tuning <= 0.0) {
    error = "tuning must be a positive frequency";
    return false;
  }
  return true;
}

bool loadConfigFile(const std::string& path, TonalConfig& config, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "cannot open " + path;
    return false;
  }
  std::ostringstream contents;
  contents << file.rdbuf();

  std::map<std::string, JsonValue> entries;
  std::string parse_error;
  if (!parseJsonObject(contents.str(), entries, parse_error)) {
    error = path + ": " + parse_error;
    return false;
  }

  TonalConfig updated = config;
  applyConfigJson(entries, updated);
  if (!validateConfig(updated, error)) {
    error = path + ": " + error;
    return false;
  }
  config = updated;
  return true;
}

}  // namespace tonal
