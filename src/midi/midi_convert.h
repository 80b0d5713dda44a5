// MIDI number validation and conversion to/from frequencies and note names.

#ifndef TONAL_MIDI_MIDI_CONVERT_H
#define TONAL_MIDI_MIDI_CONVERT_H

#include <optional>
#include <string>
#include <string_view>

namespace tonal {
namespace midi {

/// Default concert pitch for A4 (MIDI 69), in Hz.
constexpr double kDefaultTuning = 440.0;

/// MIDI number of A4.
constexpr int kMidiA4 = 69;

/// @brief Check whether a value is a valid MIDI note number (0-127).
inline bool isMidi(int midi) { return midi >= 0 && midi <= 127; }

/// @brief Validate an integer MIDI number.
/// @return The value, or std::nullopt outside [0, 127].
std::optional<int> toMidi(int midi);

/// @brief Round a real-valued MIDI number (half away from zero) and validate.
/// @return std::nullopt for NaN, infinities, or out-of-range values.
std::optional<int> toMidi(double value);

/// @brief Parse numeric text ("60") or a note name with octave ("C4").
/// @return std::nullopt for anything else or out-of-range results.
std::optional<int> toMidi(std::string_view text);

/// @brief Frequency of a MIDI number: tuning * 2^((midi - 69) / 12).
double midiToFreq(double midi, double tuning = kDefaultTuning);

/// @brief Real-valued MIDI number of a frequency: 69 + 12 * log2(freq / tuning).
double freqToMidi(double freq, double tuning = kDefaultTuning);

/// @brief Name of a MIDI number ("Db4", "C#4", or "Db" as pitch class).
/// @param midi MIDI number.
/// @param sharps Spell black keys with sharps instead of flats.
/// @param pitch_class Omit the octave.
/// @return Empty string when midi is not in [0, 127].
std::string midiToNoteName(int midi, bool sharps = false, bool pitch_class = false);

/// @brief Real-valued overload; rounds first, empty string for NaN/inf.
std::string midiToNoteName(double midi, bool sharps = false, bool pitch_class = false);

}  // namespace midi
}  // namespace tonal

#endif  // TONAL_MIDI_MIDI_CONVERT_H
