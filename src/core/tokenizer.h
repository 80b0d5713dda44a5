// Lexers for note names ("C#4", "fx", "Bb-1") and interval names
// ("5P", "-3m", "P4", "m-2").

#ifndef TONAL_CORE_TOKENIZER_H
#define TONAL_CORE_TOKENIZER_H

#include <string>
#include <string_view>

namespace tonal {

/// @brief Tokens of a note name.
///
/// letter is empty when the text does not start like a note name.
/// accidentals never contains 'x' (each x is expanded to "##").
/// rest holds unparsed text after the octave and optional whitespace;
/// a non-empty rest means the text is not a valid note name.
struct NoteTokens {
  std::string letter;
  std::string accidentals;
  std::string octave;
  std::string rest;
};

/// @brief Tokens of an interval name, always in (number, quality) order.
///
/// Both fields are empty when neither grammar matches.
struct IntervalTokens {
  std::string number;
  std::string quality;
};

/// @brief Split a note name into letter, accidentals, octave and rest.
NoteTokens tokenizeNote(std::string_view text);

/// @brief Split an interval name in tonal ("4P") or shorthand ("P4") form.
IntervalTokens tokenizeInterval(std::string_view text);

}  // namespace tonal

#endif  // TONAL_CORE_TOKENIZER_H
