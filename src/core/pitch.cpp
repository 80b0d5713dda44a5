/// @file
/// @brief Encode/decode between PitchInfo and line-of-fifths coordinates.

#include "core/pitch.h"

#include <type_traits>

namespace tonal {

namespace {

/// Step for each (fifths + 1) mod 7, i.e. the order F C G D A E B.
constexpr int kFifthsToSteps[7] = {3, 0, 4, 1, 5, 2, 6};

/// @brief Decode raw (unsigned) coordinates in 64-bit arithmetic.
std::optional<PitchInfo> decodeWide(long long fifths, std::optional<long long> octaves) {
  long long alt = floorDiv(fifths + 1, 7LL);
  if (alt < -kMaxAlteration || alt > kMaxAlteration) return std::nullopt;

  PitchInfo pitch;
  pitch.step = kFifthsToSteps[floorMod(fifths + 1, 7LL)];
  pitch.alt = static_cast<int>(alt);
  if (octaves.has_value()) {
    long long oct = *octaves + 4 * alt + stepToOctaves(pitch.step);
    if (oct < -kMaxOctave || oct > kMaxOctave) return std::nullopt;
    pitch.oct = static_cast<int>(oct);
  }
  return pitch;
}

}  // namespace

bool pitchInRange(const PitchInfo& pitch) {
  if (pitch.step < 0 || pitch.step > 6) return false;
  if (pitch.alt < -kMaxAlteration || pitch.alt > kMaxAlteration) return false;
  return !pitch.oct.has_value() || (*pitch.oct >= -kMaxOctave && *pitch.oct <= kMaxOctave);
}

int stepToOctaves(int step) {
  return floorDiv(kStepFifths[step] * 7, 12);
}

std::optional<PitchInfo> pitchFromCoordinates(const Coordinates& coord) {
  return std::visit(
      [](const auto& value) -> std::optional<PitchInfo> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, PitchClassCoordinates>) {
          return decodeWide(value.fifths, std::nullopt);
        } else if constexpr (std::is_same_v<T, NoteCoordinates>) {
          return decodeWide(value.fifths, static_cast<long long>(value.octaves));
        } else {
          // Interval coordinates are signed; undo the direction first.
          long long sign = directionSign(value.direction);
          std::optional<PitchInfo> pitch =
              decodeWide(sign * value.fifths, sign * value.octaves);
          if (pitch.has_value()) pitch->dir = value.direction;
          return pitch;
        }
      },
      coord);
}

Coordinates pitchToCoordinates(const PitchInfo& pitch) {
  int fifths = kStepFifths[pitch.step] + 7 * pitch.alt;
  int sign = directionSign(pitch.dir.value_or(Direction::Ascending));

  if (!pitch.oct.has_value()) {
    return PitchClassCoordinates{sign * fifths};
  }

  int octaves = *pitch.oct - stepToOctaves(pitch.step) - 4 * pitch.alt;
  if (pitch.dir.has_value()) {
    return IntervalCoordinates{sign * fifths, sign * octaves, *pitch.dir};
  }
  return NoteCoordinates{fifths, octaves};
}

std::string pitchName(const PitchInfo& pitch) {
  if (pitch.step < 0 || pitch.step > 6) {
    return "";
  }
  std::string name(1, kStepLetters[pitch.step]);
  if (pitch.alt < 0) {
    name.append(static_cast<size_t>(-pitch.alt), 'b');
  } else {
    name.append(static_cast<size_t>(pitch.alt), '#');
  }
  if (pitch.oct.has_value()) {
    name += std::to_string(*pitch.oct);
  }
  return name;
}

int pitchHeight(const PitchInfo& pitch) {
  int sign = directionSign(pitch.dir.value_or(Direction::Ascending));
  int oct = pitch.oct.value_or(kNoOctaveHeight);
  return sign * (kStepSemitones[pitch.step] + pitch.alt + 12 * oct);
}

int pitchChroma(const PitchInfo& pitch) {
  return floorMod(kStepSemitones[pitch.step] + pitch.alt, 12);
}

std::optional<int> pitchMidi(const PitchInfo& pitch) {
  if (!pitch.oct.has_value()) return std::nullopt;
  int height = pitchHeight(pitch);
  if (height < -12 || height > 115) return std::nullopt;
  return height + 12;
}

}  // namespace tonal
