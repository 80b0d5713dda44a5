/// @file
/// @brief Compact JSON writer for descriptor output.

#include "core/json_writer.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tonal {

void JsonWriter::separate() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!has_element_.empty() && has_element_.back()) buffer_ += ',';
}

void JsonWriter::wrote() {
  if (!has_element_.empty()) has_element_.back() = true;
}

void JsonWriter::beginObject() {
  separate();
  buffer_ += '{';
  has_element_.push_back(false);
}

void JsonWriter::endObject() {
  buffer_ += '}';
  if (!has_element_.empty()) has_element_.pop_back();
  wrote();
}

void JsonWriter::beginArray() {
  separate();
  buffer_ += '[';
  has_element_.push_back(false);
}

void JsonWriter::endArray() {
  buffer_ += ']';
  if (!has_element_.empty()) has_element_.pop_back();
  wrote();
}

void JsonWriter::key(std::string_view name) {
  separate();
  buffer_ += '"';
  buffer_ += escape(name);
  buffer_ += "\":";
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  separate();
  buffer_ += '"';
  buffer_ += escape(val);
  buffer_ += '"';
  wrote();
}

void JsonWriter::value(int val) {
  separate();
  buffer_ += std::to_string(val);
  wrote();
}

void JsonWriter::value(double val) {
  if (!std::isfinite(val)) {
    valueNull();
    return;
  }
  separate();
  // Fewest significant digits (15 to 17) that read back to the same value.
  char text[32];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(text, sizeof(text), "%.*g", precision, val);
    if (std::strtod(text, nullptr) == val) break;
  }
  buffer_ += text;
  wrote();
}

void JsonWriter::value(bool val) {
  separate();
  buffer_ += val ? "true" : "false";
  wrote();
}

void JsonWriter::valueNull() {
  separate();
  buffer_ += "null";
  wrote();
}

void JsonWriter::value(const std::vector<std::string>& vals) {
  beginArray();
  for (const auto& item : vals) {
    value(std::string_view(item));
  }
  endArray();
}

std::string JsonWriter::escape(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char chr : input) {
    switch (chr) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex[8];
          std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned>(chr));
          out += hex;
        } else {
          out += chr;
        }
        break;
    }
  }
  return out;
}

}  // namespace tonal
