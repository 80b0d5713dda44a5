/// @file
/// @brief Character-scanning lexers for note and interval names.

#include "core/tokenizer.h"

#include <cctype>

namespace tonal {

namespace {

bool isDigit(char chr) {
  return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

/// @brief Scan "[-+]?digits" starting at pos.
/// @return Length of the match, 0 if there is none.
size_t scanSignedNumber(std::string_view text, size_t pos) {
  size_t end = pos;
  if (end < text.size() && (text[end] == '-' || text[end] == '+')) ++end;
  size_t digits_start = end;
  while (end < text.size() && isDigit(text[end])) ++end;
  if (end == digits_start) return 0;
  return end - pos;
}

/// @brief Count how many times chr repeats starting at pos.
size_t runLength(std::string_view text, size_t pos, char chr) {
  size_t len = 0;
  while (pos + len < text.size() && text[pos + len] == chr) ++len;
  return len;
}

/// @brief Check a tonal-form quality token: d{1,4} | m | M | P | A{1,4}.
bool isTonalQuality(std::string_view quality) {
  if (quality == "m" || quality == "M" || quality == "P") return true;
  if (quality.empty() || quality.size() > 4) return false;
  char head = quality[0];
  if (head != 'd' && head != 'A') return false;
  return runLength(quality, 0, head) == quality.size();
}

}  // namespace

NoteTokens tokenizeNote(std::string_view text) {
  NoteTokens tokens;
  size_t pos = 0;

  if (pos < text.size()) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(text[pos])));
    if (upper >= 'A' && upper <= 'G') {
      tokens.letter.assign(1, upper);
      ++pos;
    }
  }

  if (pos < text.size() && text[pos] == 'x') {
    size_t count = runLength(text, pos, 'x');
    tokens.accidentals.assign(count * 2, '#');
    pos += count;
  } else {
    while (pos < text.size() && (text[pos] == '#' || text[pos] == 'b')) {
      tokens.accidentals += text[pos];
      ++pos;
    }
  }

  size_t oct_start = pos;
  if (pos < text.size() && text[pos] == '-') ++pos;
  size_t digits_start = pos;
  while (pos < text.size() && isDigit(text[pos])) ++pos;
  if (pos == digits_start) {
    pos = oct_start;  // A lone '-' is not an octave.
  } else {
    tokens.octave.assign(text.substr(oct_start, pos - oct_start));
  }

  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  tokens.rest.assign(text.substr(pos));
  return tokens;
}

IntervalTokens tokenizeInterval(std::string_view text) {
  IntervalTokens tokens;
  if (text.empty()) return tokens;

  // Tonal form: number first, quality after.
  size_t num_len = scanSignedNumber(text, 0);
  if (num_len > 0) {
    std::string_view quality = text.substr(num_len);
    if (isTonalQuality(quality)) {
      tokens.number.assign(text.substr(0, num_len));
      tokens.quality.assign(quality);
    }
    return tokens;
  }

  // Shorthand form: AA | A | P | M | m | d | dd, then number.
  char head = text[0];
  size_t q_len = 0;
  if (head == 'A' || head == 'd') {
    q_len = runLength(text, 0, head);
    if (q_len > 2) return tokens;
  } else if (head == 'P' || head == 'M' || head == 'm') {
    q_len = 1;
  } else {
    return tokens;
  }

  num_len = scanSignedNumber(text, q_len);
  if (num_len == 0 || q_len + num_len != text.size()) return tokens;

  tokens.number.assign(text.substr(q_len, num_len));
  tokens.quality.assign(text.substr(0, q_len));
  return tokens;
}

}  // namespace tonal
