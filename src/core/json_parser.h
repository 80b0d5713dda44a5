// Minimal flat-object JSON parser for configuration files (no external
// dependencies).
//
// Accepts a single top-level object whose values are strings, numbers,
// booleans, or null. Nested objects and arrays are reported as errors.

#ifndef TONAL_CORE_JSON_PARSER_H
#define TONAL_CORE_JSON_PARSER_H

#include <map>
#include <string>
#include <string_view>

namespace tonal {

/// @brief A single JSON scalar value.
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as double, with default for non-numbers.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default for non-booleans.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default for non-strings.
  std::string asString(const std::string& default_val = "") const;
};

/// @brief Parse a flat JSON object into a key-value map.
/// @param json JSON text.
/// @param out Receives the parsed entries (cleared first). Later duplicate
///        keys overwrite earlier ones.
/// @param error Receives a message with the byte offset on failure.
/// @return True on success.
bool parseJsonObject(std::string_view json, std::map<std::string, JsonValue>& out,
                     std::string& error);

}  // namespace tonal

#endif  // TONAL_CORE_JSON_PARSER_H
