/// @file
/// @brief MIDI number validation, frequency conversion, and note naming.

#include "midi/midi_convert.h"

#include <cctype>
#include <charconv>
#include <cmath>

#include "core/pitch.h"
#include "core/tokenizer.h"

namespace tonal {
namespace midi {

namespace {

constexpr const char* kFlatNames[12] = {
    "C", "Db", "D", "Eb", "E", "F", "Gb", "G", "Ab", "A", "Bb", "B"};
constexpr const char* kSharpNames[12] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

/// @brief Strip leading and trailing whitespace.
std::string_view trim(std::string_view text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

/// @brief Parse "[-+]?digits" filling the whole view.
bool parseInteger(std::string_view text, int& out) {
  if (!text.empty() && text[0] == '+') text.remove_prefix(1);
  if (text.empty()) return false;
  const char* last = text.data() + text.size();
  auto result = std::from_chars(text.data(), last, out);
  return result.ec == std::errc() && result.ptr == last;
}

}  // namespace

std::optional<int> toMidi(int midi) {
  if (!isMidi(midi)) return std::nullopt;
  return midi;
}

std::optional<int> toMidi(double value) {
  if (!std::isfinite(value)) return std::nullopt;
  // Anything outside this window rounds outside [0, 127].
  if (value <= -1.0 || value >= 128.0) return std::nullopt;
  return toMidi(static_cast<int>(std::lround(value)));
}

std::optional<int> toMidi(std::string_view text) {
  std::string_view trimmed = trim(text);
  if (trimmed.empty()) return std::nullopt;

  int number = 0;
  if (parseInteger(trimmed, number)) return toMidi(number);

  NoteTokens tokens = tokenizeNote(trimmed);
  if (tokens.letter.empty() || tokens.octave.empty() || !tokens.rest.empty()) {
    return std::nullopt;
  }
  int octave = 0;
  if (!parseInteger(tokens.octave, octave)) return std::nullopt;
  if (octave < -2 || octave > 10) return std::nullopt;

  int step = static_cast<int>(std::string_view(kStepLetters).find(tokens.letter[0]));
  int alt = 0;
  for (char acc : tokens.accidentals) {
    alt += (acc == '#') ? 1 : -1;
  }
  long value = (static_cast<long>(octave) + 1) * 12 + kStepSemitones[step] + alt;
  if (value < 0 || value > 127) return std::nullopt;
  return static_cast<int>(value);
}

double midiToFreq(double midi, double tuning) {
  return tuning * std::pow(2.0, (midi - kMidiA4) / 12.0);
}

double freqToMidi(double freq, double tuning) {
  return kMidiA4 + 12.0 * std::log2(freq / tuning);
}

std::string midiToNoteName(int midi, bool sharps, bool pitch_class) {
  if (!isMidi(midi)) return "";

  const char* const* names = sharps ? kSharpNames : kFlatNames;
  std::string name = names[midi % 12];
  if (pitch_class) return name;
  return name + std::to_string(midi / 12 - 1);
}

std::string midiToNoteName(double midi, bool sharps, bool pitch_class) {
  std::optional<int> rounded = toMidi(midi);
  if (!rounded.has_value()) return "";
  return midiToNoteName(*rounded, sharps, pitch_class);
}

}  // namespace midi
}  // namespace tonal
