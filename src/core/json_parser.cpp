/// @file
/// @brief Flat-object JSON parser used by configuration loading.

#include "core/json_parser.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace tonal {

// ---------------------------------------------------------------------------
// JsonValue accessors
// ---------------------------------------------------------------------------

double JsonValue::asDouble(double default_val) const {
  if (type != Number) return default_val;
  return number_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type != Bool) return default_val;
  return bool_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type != String) return default_val;
  return string_val;
}

namespace {

/// @brief Cursor over the input with error capture.
class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {}

  void skipWhitespace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool atEnd() const { return pos_ >= text_.size(); }
  char peek() const { return atEnd() ? '\0' : text_[pos_]; }

  bool consume(char expected) {
    if (peek() != expected) return false;
    ++pos_;
    return true;
  }

  bool consumeWord(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) return false;
    pos_ += word.size();
    return true;
  }

  bool fail(const std::string& message, std::string& error) const {
    error = message + " at offset " + std::to_string(pos_);
    return false;
  }

  /// @brief Parse a quoted string, with escapes. Cursor must be on '"'.
  bool parseString(std::string& out, std::string& error) {
    if (!consume('"')) return fail("expected '\"'", error);
    out.clear();
    while (!atEnd()) {
      char chr = text_[pos_++];
      if (chr == '"') return true;
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (atEnd()) break;
      char esc = text_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u':
          if (!parseUnicodeEscape(out)) return fail("bad \\u escape", error);
          break;
        default:
          return fail("unknown escape", error);
      }
    }
    return fail("unterminated string", error);
  }

  /// @brief Parse a number with strtod over the JSON number characters.
  bool parseNumber(double& out, std::string& error) {
    size_t start = pos_;
    while (!atEnd()) {
      char chr = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(chr)) || chr == '-' || chr == '+' ||
          chr == '.' || chr == 'e' || chr == 'E') {
        ++pos_;
      } else {
        break;
      }
    }
    std::string token(text_.substr(start, pos_ - start));
    if (token.empty()) return fail("expected value", error);

    char* end = nullptr;
    errno = 0;
    out = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || errno == ERANGE) {
      pos_ = start;
      return fail("invalid number", error);
    }
    return true;
  }

  /// @brief Parse one scalar value at the cursor.
  bool parseValue(JsonValue& out, std::string& error) {
    char chr = peek();
    if (chr == '"') {
      out.type = JsonValue::String;
      return parseString(out.string_val, error);
    }
    if (chr == '{' || chr == '[') return fail("nested values are not supported", error);
    if (consumeWord("true")) {
      out.type = JsonValue::Bool;
      out.bool_val = true;
      return true;
    }
    if (consumeWord("false")) {
      out.type = JsonValue::Bool;
      out.bool_val = false;
      return true;
    }
    if (consumeWord("null")) {
      out.type = JsonValue::Null;
      return true;
    }
    out.type = JsonValue::Number;
    return parseNumber(out.number_val, error);
  }

 private:
  /// @brief Decode 4 hex digits into UTF-8 (BMP only).
  bool parseUnicodeEscape(std::string& out) {
    if (pos_ + 4 > text_.size()) return false;
    unsigned code = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char hex = text_[pos_++];
      code <<= 4;
      if (hex >= '0' && hex <= '9') {
        code |= static_cast<unsigned>(hex - '0');
      } else if (hex >= 'a' && hex <= 'f') {
        code |= static_cast<unsigned>(hex - 'a' + 10);
      } else if (hex >= 'A' && hex <= 'F') {
        code |= static_cast<unsigned>(hex - 'A' + 10);
      } else {
        return false;
      }
    }
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
    return true;
  }

  std::string_view text_;
  size_t pos_ = 0;
};

}  // namespace

bool parseJsonObject(std::string_view json, std::map<std::string, JsonValue>& out,
                     std::string& error) {
  out.clear();
  Reader reader(json);

  reader.skipWhitespace();
  if (!reader.consume('{')) return reader.fail("expected '{'", error);

  reader.skipWhitespace();
  if (!reader.consume('}')) {
    while (true) {
      reader.skipWhitespace();
      std::string key;
      if (!reader.parseString(key, error)) return false;

      reader.skipWhitespace();
      if (!reader.consume(':')) return reader.fail("expected ':'", error);
      reader.skipWhitespace();

      JsonValue val;
      if (!reader.parseValue(val, error)) return false;
      out[key] = std::move(val);

      reader.skipWhitespace();
      if (reader.consume(',')) continue;
      if (reader.consume('}')) break;
      return reader.fail("expected ',' or '}'", error);
    }
  }

  reader.skipWhitespace();
  if (!reader.atEnd()) return reader.fail("trailing characters", error);
  return true;
}

}  // namespace tonal
