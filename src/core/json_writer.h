// Minimal JSON serialization writer (no external dependencies).
//
// Builds compact JSON text for the CLI's --json output.

#ifndef TONAL_CORE_JSON_WRITER_H
#define TONAL_CORE_JSON_WRITER_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tonal {

/// @brief Incremental JSON writer with automatic comma placement.
///
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("name");
///   writer.value("C4");
///   writer.key("midi");
///   writer.value(60);
///   writer.endObject();
///   writer.toString();  // -> {"name":"C4","midi":60}
/// @endcode
///
/// Structure is not validated; begin/end calls must be balanced by the caller.
class JsonWriter {
 public:
  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key; the next call must write its value.
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// Keeps string literals away from the bool overload.
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);

  /// @brief Write a number with the shortest round-trip precision.
  /// NaN and infinities are written as null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Write the contained value, or null when absent.
  template <typename T>
  void value(const std::optional<T>& val) {
    if (val.has_value()) {
      value(*val);
    } else {
      valueNull();
    }
  }

  /// @brief Write an array of strings.
  void value(const std::vector<std::string>& vals);

  /// @brief Get the JSON text built so far.
  const std::string& toString() const { return buffer_; }

  /// @brief Escape quotes, backslashes and control characters.
  static std::string escape(std::string_view input);

 private:
  /// Emit a separating comma when a sibling precedes the next element.
  void separate();

  /// Record that the current container now holds an element.
  void wrote();

  std::string buffer_;
  std::vector<bool> has_element_;  ///< One entry per open container.
  bool after_key_ = false;
};

}  // namespace tonal

#endif  // TONAL_CORE_JSON_WRITER_H
