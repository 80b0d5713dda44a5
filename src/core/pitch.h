// Pitch decomposition (step, alteration, octave, direction) and its
// bidirectional mapping to line-of-fifths coordinates.

#ifndef TONAL_CORE_PITCH_H
#define TONAL_CORE_PITCH_H

#include <optional>
#include <string>

#include "core/coordinates.h"

namespace tonal {

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------

/// Letters of the natural steps, indexed by step (C=0).
constexpr const char* kStepLetters = "CDEFGAB";

/// Line-of-fifths position of each natural step [C, D, E, F, G, A, B].
constexpr int kStepFifths[7] = {0, 2, 4, -1, 1, 3, 5};

/// Semitones above C of each natural step.
constexpr int kStepSemitones[7] = {0, 2, 4, 5, 7, 9, 11};

/// Sentinel octave used by pitchHeight() for pitches without octave.
constexpr int kNoOctaveHeight = -100;

/// Largest |alteration| a pitch may carry. Parsers reject longer accidental
/// or quality runs, and coordinate arithmetic past it has no result.
constexpr int kMaxAlteration = 1000;

/// Largest |octave| a pitch may carry.
constexpr int kMaxOctave = 1000000;

/// Largest |fifths| coordinate of any pitch within kMaxAlteration.
constexpr int kMaxFifths = 7 * kMaxAlteration + 5;

// ---------------------------------------------------------------------------
// Integer helpers
// ---------------------------------------------------------------------------

/// @brief Integer division rounding toward negative infinity.
/// @param num Dividend (may be negative).
/// @param den Divisor (must be positive).
inline int floorDiv(int num, int den) {
  int quot = num / den;
  if ((num % den != 0) && (num < 0)) --quot;
  return quot;
}

/// @brief Modulo with a result always in [0, den).
inline int floorMod(int num, int den) {
  int rem = num % den;
  return rem < 0 ? rem + den : rem;
}

inline long long floorDiv(long long num, long long den) {
  long long quot = num / den;
  if ((num % den != 0) && (num < 0)) --quot;
  return quot;
}

inline long long floorMod(long long num, long long den) {
  long long rem = num % den;
  return rem < 0 ? rem + den : rem;
}

// ---------------------------------------------------------------------------
// PitchInfo
// ---------------------------------------------------------------------------

/// @brief Structural decomposition of a pitch class, note, or interval.
///
/// - pitch class: oct and dir absent
/// - note:        oct present, dir absent
/// - interval:    oct and dir present
struct PitchInfo {
  int step = 0;  ///< 0..6, C..B
  int alt = 0;   ///< Signed alteration in semitones (+ sharps, - flats).
  std::optional<int> oct;
  std::optional<Direction> dir;

  bool operator==(const PitchInfo& other) const {
    return step == other.step && alt == other.alt && oct == other.oct &&
           dir == other.dir;
  }
  bool operator!=(const PitchInfo& other) const { return !(*this == other); }
};

/// @brief Whether step is 0..6 and alteration and octave are within
/// kMaxAlteration and kMaxOctave.
bool pitchInRange(const PitchInfo& pitch);

/// @brief Octave correction per step: floor(kStepFifths[step] * 7 / 12).
int stepToOctaves(int step);

/// @brief Decode coordinates into a PitchInfo.
///
/// Pitch-class coordinates yield no octave/direction, note coordinates an
/// octave only, interval coordinates both. Defined for every int input.
/// @return std::nullopt when the decoded pitch fails pitchInRange().
std::optional<PitchInfo> pitchFromCoordinates(const Coordinates& coord);

/// @brief Encode a PitchInfo into coordinates.
///
/// The pitch must satisfy pitchInRange().
/// The variant is chosen by which optional fields are present:
/// no octave -> PitchClassCoordinates, octave only -> NoteCoordinates,
/// octave and direction -> IntervalCoordinates.
Coordinates pitchToCoordinates(const PitchInfo& pitch);

/// @brief Note-style name of a pitch ("C", "F#", "Bb4").
/// @return Empty string if step is outside 0..6.
std::string pitchName(const PitchInfo& pitch);

/// @brief Signed semitone height.
///
/// dir * (semitones(step) + alt + 12 * oct), using kNoOctaveHeight when the
/// octave is absent. C4 -> 48, C -> -1200, descending fifth -> -7.
int pitchHeight(const PitchInfo& pitch);

/// @brief Chroma (0-11) of a pitch, ignoring octave and direction.
int pitchChroma(const PitchInfo& pitch);

/// @brief MIDI number of a pitch with octave (C4 = 60).
/// @return std::nullopt without octave or outside [0, 127].
std::optional<int> pitchMidi(const PitchInfo& pitch);

}  // namespace tonal

#endif  // TONAL_CORE_PITCH_H
