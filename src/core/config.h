// Runtime configuration shared by the CLI: tuning, spelling, output format.

#ifndef TONAL_CORE_CONFIG_H
#define TONAL_CORE_CONFIG_H

#include <map>
#include <string>

#include "core/json_parser.h"

namespace tonal {

/// @brief Settings read from a JSON config file and overridden by CLI flags.
struct TonalConfig {
  double tuning = 440.0;     ///< Frequency of A4 in Hz.
  bool sharps = false;       ///< Spell black keys with sharps.
  bool json_output = false;  ///< Print results as JSON.
  bool verbose = false;      ///< Trace evaluated commands to stderr.
};

/// @brief Apply parsed JSON entries on top of a config.
///
/// Recognized keys: "tuning" (number), "sharps", "json", "verbose" (bool).
/// Unknown keys and values of the wrong type are logged and skipped.
/// @param entries Output of parseJsonObject().
/// @param config Updated in place.
void applyConfigJson(const std::map<std::string, JsonValue>& entries, TonalConfig& config);

/// @brief Check value ranges.
/// @param error Receives the reason on failure.
/// @return True if the tuning is finite and positive.
bool validateConfig(const TonalConfig& config, std::string& error);

/// @brief Read, parse, apply and validate a JSON config file.
/// @param path File path.
/// @param config Updated in place; left untouched on failure.
/// @param error Receives the reason on failure.
/// @return True on success.
bool loadConfigFile(const std::string& path, TonalConfig& config, std::string& error);

}  // namespace tonal

#endif  // TONAL_CORE_CONFIG_H
