// Line-of-fifths coordinates shared by pitch classes, notes, and intervals.

#ifndef TONAL_CORE_COORDINATES_H
#define TONAL_CORE_COORDINATES_H

#include <cstdint>
#include <optional>
#include <variant>

namespace tonal {

/// Direction of an interval.
enum class Direction : int8_t {
  Ascending = 1,
  Descending = -1
};

/// @brief Position of a pitch class on the line of fifths (octave-agnostic).
///
/// fifths = 0 is C, +1 is G, -1 is F, +7 is C#, -7 is Cb.
struct PitchClassCoordinates {
  int fifths = 0;

  bool operator==(const PitchClassCoordinates& other) const {
    return fifths == other.fifths;
  }
  bool operator!=(const PitchClassCoordinates& other) const {
    return !(*this == other);
  }
};

/// @brief Absolute pitch: fifths plus an octave count.
struct NoteCoordinates {
  int fifths = 0;
  int octaves = 0;

  bool operator==(const NoteCoordinates& other) const {
    return fifths == other.fifths && octaves == other.octaves;
  }
  bool operator!=(const NoteCoordinates& other) const {
    return !(*this == other);
  }
};

/// @brief Signed displacement.
///
/// fifths and octaves are stored already multiplied by the direction
/// (a descending fifth is {-1, 0, Descending}), so interval coordinates
/// can be added to note coordinates directly.
struct IntervalCoordinates {
  int fifths = 0;
  int octaves = 0;
  Direction direction = Direction::Ascending;

  bool operator==(const IntervalCoordinates& other) const {
    return fifths == other.fifths && octaves == other.octaves &&
           direction == other.direction;
  }
  bool operator!=(const IntervalCoordinates& other) const {
    return !(*this == other);
  }
};

/// Tagged union over the three coordinate variants.
using Coordinates =
    std::variant<PitchClassCoordinates, NoteCoordinates, IntervalCoordinates>;

/// @brief Get the fifths component common to every variant.
int coordinateFifths(const Coordinates& coord);

/// @brief Get the octaves component.
/// @return std::nullopt for pitch-class coordinates.
std::optional<int> coordinateOctaves(const Coordinates& coord);

/// @brief Convert a direction to its integer sign (+1 / -1).
inline int directionSign(Direction dir) { return static_cast<int>(dir); }

}  // namespace tonal

#endif  // TONAL_CORE_COORDINATES_H
