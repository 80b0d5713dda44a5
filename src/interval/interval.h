// Interval names: parsing into IntervalInfo descriptors and interval
// arithmetic on line-of-fifths coordinates.

#ifndef TONAL_INTERVAL_INTERVAL_H
#define TONAL_INTERVAL_INTERVAL_H

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/coordinates.h"
#include "core/pitch.h"
#include "note/note.h"

namespace tonal {

/// Interval numbers beyond this magnitude are rejected by the parser; it is
/// the largest number whose octave count stays within kMaxOctave.
constexpr int kMaxIntervalNumber = 7 * kMaxOctave + 7;

/// Family of a diatonic interval number.
enum class IntervalType : uint8_t {
  Perfectable,  ///< 1, 4, 5, 8 (mod 7): unaltered quality is P.
  Majorable     ///< 2, 3, 6, 7 (mod 7): unaltered quality is M.
};

/// @brief Convert IntervalType to "perfectable" / "majorable".
const char* intervalTypeToString(IntervalType type);

/// @brief Parsed interval descriptor.
///
/// Invalid input yields empty == true with every other field defaulted.
struct IntervalInfo {
  bool empty = true;
  std::string name;     ///< Canonical tonal form, e.g. "4P", "-3m".
  int num = 0;          ///< Signed diatonic number, never 0.
  std::string quality;  ///< dddd ddd dd d m M P A AA AAA AAAA.
  IntervalType type = IntervalType::Perfectable;
  int step = 0;         ///< (|num| - 1) mod 7.
  int alt = 0;          ///< Semitone alteration implied by the quality.
  Direction dir = Direction::Ascending;
  int simple = 0;       ///< Octave-reduced number keeping sign; 8 stays 8.
  int semitones = 0;    ///< Signed size.
  int chroma = 0;       ///< semitones mod 12, always 0-11.
  IntervalCoordinates coord;
  int oct = 0;          ///< Whole octaves beyond the simple interval.
};

namespace interval {

/// @brief Parse an interval name in tonal ("4P") or shorthand ("P4") form.
/// @code
///   interval::get("P4").semitones;  // -> 5
///   interval::get("m-2").name;      // -> "-2m"
///   interval::get("3P").empty;      // -> true
/// @endcode
IntervalInfo get(std::string_view interval_name);

/// @brief Build an interval from a PitchInfo carrying octave and direction.
IntervalInfo get(const PitchInfo& pitch);

/// @brief Tonal-form name of a pitch ("5P", "-3m").
///
/// A descending unison-class pitch whose number works out to 0 is named by
/// its step alone. Returns "" when octave or direction is missing.
std::string pitchToIntervalName(const PitchInfo& pitch);

/// @brief Interval spanned by a coordinate offset.
///
/// The direction is derived from the sign of 7 * fifths + 12 * octaves
/// (the semitone size); pitch-class coordinates use 0 octaves.
/// @param force_descending Report descending even for a zero-size offset.
/// @return An empty descriptor when the result is out of range.
IntervalInfo fromCoordinates(const Coordinates& coord, bool force_descending = false);

// ---------------------------------------------------------------------------
// Property accessors
// ---------------------------------------------------------------------------

std::string name(std::string_view interval_name);
int num(std::string_view interval_name);
std::string quality(std::string_view interval_name);
int semitones(std::string_view interval_name);

/// @brief One interval per step: 1P 2M 3M 4P 5P 6m 7m.
std::vector<std::string> names();

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

/// @brief Interval between two notes; "" if either is invalid.
std::string distance(const NoteInfo& from, const NoteInfo& to);

/// @brief Interval between two note names ("C4", "G4" -> "5P").
std::string distance(const std::string& from_note, const std::string& to_note);

/// @brief Octave-reduce keeping sign and quality ("9M" -> "2M", "8P" stays).
std::string simplify(std::string_view interval_name);

/// @brief Inversion ("3m" -> "6M", "2M" -> "7m"); compound octaves are kept.
std::string invert(std::string_view interval_name);

/// @brief Canonical interval of a semitone count (6 -> "5d", -7 -> "-5P").
/// @return "" past kMaxOctave octaves (|semitones| >= 12 * (kMaxOctave + 1)).
std::string fromSemitones(int semitones);

// add, subtract and transposeFifths return "" when the result has no
// parseable name: more than four A or d, or more than kMaxOctave octaves.

/// @brief Sum of two intervals ("3m", "5P" -> "7m"); "" if either is invalid.
std::string add(std::string_view lhs, std::string_view rhs);

/// @brief Difference of two intervals ("3M", "5P" -> "-3m").
std::string subtract(std::string_view minuend, std::string_view subtrahend);

/// @brief Shift an interval along the line of fifths ("4P", 1 -> "8P").
std::string transposeFifths(std::string_view interval_name, int fifths);

/// @brief Adds a fixed interval to any interval.
class AddTo {
 public:
  explicit AddTo(std::string interval_name) : interval_name_(std::move(interval_name)) {}

  std::string operator()(std::string_view other) const { return add(interval_name_, other); }

 private:
  std::string interval_name_;
};

}  // namespace interval
}  // namespace tonal

#endif  // TONAL_INTERVAL_INTERVAL_H
