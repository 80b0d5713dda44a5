/// @file
/// @brief Interval parsing, naming, and coordinate arithmetic.

#include "interval/interval.h"

#include <charconv>
#include <cstdlib>

#include "core/tokenizer.h"

namespace tonal {

namespace {

/// Interval number for each semitone class (fromSemitones).
constexpr int kSemitoneNumbers[12] = {1, 2, 2, 3, 3, 4, 5, 5, 6, 6, 7, 7};

/// Quality for each semitone class (fromSemitones).
constexpr const char* kSemitoneQualities[12] = {
    "P", "m", "M", "m", "M", "P", "d", "P", "m", "M", "m", "M"};

/// Interval family per step: P = perfectable, M = majorable.
constexpr const char* kStepTypes = "PMMPPMM";

IntervalType typeOfStep(int step) {
  return kStepTypes[step] == 'M' ? IntervalType::Majorable : IntervalType::Perfectable;
}

/// @brief Check that a quality fits the interval family.
bool isValidQuality(IntervalType type, const std::string& quality) {
  if (type == IntervalType::Majorable) return quality != "P";
  return quality != "M" && quality != "m";
}

/// @brief Semitone alteration implied by a quality.
///
/// Diminished majorable intervals sit one semitone below minor, so each 'd'
/// on a majorable number counts one more than on a perfectable one.
int qualityToAlt(IntervalType type, const std::string& quality) {
  if (quality == "M" || quality == "P") return 0;
  if (quality == "m") return -1;
  int len = static_cast<int>(quality.size());
  if (quality[0] == 'A') return len;
  return type == IntervalType::Perfectable ? -len : -(len + 1);
}

/// @brief Inverse of qualityToAlt.
std::string altToQuality(IntervalType type, int alt) {
  if (alt == 0) return type == IntervalType::Majorable ? "M" : "P";
  if (alt == -1 && type == IntervalType::Majorable) return "m";
  if (alt > 0) return std::string(static_cast<size_t>(alt), 'A');
  int count = type == IntervalType::Perfectable ? -alt : -(alt + 1);
  return std::string(static_cast<size_t>(count), 'd');
}

/// @brief Parse a signed interval number token, rejecting 0 and overflow.
bool parseNumber(std::string_view token, int& out) {
  if (!token.empty() && token[0] == '+') token.remove_prefix(1);
  const char* last = token.data() + token.size();
  auto result = std::from_chars(token.data(), last, out);
  if (result.ec != std::errc() || result.ptr != last) return false;
  return out != 0 && out >= -kMaxIntervalNumber && out <= kMaxIntervalNumber;
}

}  // namespace

const char* intervalTypeToString(IntervalType type) {
  switch (type) {
    case IntervalType::Perfectable: return "perfectable";
    case IntervalType::Majorable:   return "majorable";
  }
  return "perfectable";
}

namespace interval {

IntervalInfo get(std::string_view interval_name) {
  IntervalTokens tokens = tokenizeInterval(interval_name);
  if (tokens.number.empty()) return IntervalInfo{};

  int number = 0;
  if (!parseNumber(tokens.number, number)) return IntervalInfo{};

  int abs_num = std::abs(number);
  int step = (abs_num - 1) % 7;
  IntervalType type = typeOfStep(step);
  if (!isValidQuality(type, tokens.quality)) return IntervalInfo{};

  int sign = number < 0 ? -1 : 1;
  int alt = qualityToAlt(type, tokens.quality);
  int oct = (abs_num - 1) / 7;

  IntervalInfo info;
  info.empty = false;
  info.name = std::to_string(number) + tokens.quality;
  info.num = number;
  info.quality = tokens.quality;
  info.type = type;
  info.step = step;
  info.alt = alt;
  info.dir = sign < 0 ? Direction::Descending : Direction::Ascending;
  info.simple = (abs_num == 8) ? number : sign * (step + 1);
  info.semitones = sign * (kStepSemitones[step] + alt + 12 * oct);
  info.chroma = floorMod(sign * (kStepSemitones[step] + alt), 12);
  info.oct = oct;

  PitchInfo pitch;
  pitch.step = step;
  pitch.alt = alt;
  pitch.oct = oct;
  pitch.dir = info.dir;
  info.coord = std::get<IntervalCoordinates>(pitchToCoordinates(pitch));
  return info;
}

IntervalInfo get(const PitchInfo& pitch) { return get(pitchToIntervalName(pitch)); }

std::string pitchToIntervalName(const PitchInfo& pitch) {
  if (!pitch.dir.has_value() || !pitch.oct.has_value()) return "";
  if (!pitchInRange(pitch)) return "";

  int number = pitch.step + 1 + 7 * *pitch.oct;
  // Descending pitch-class unison: there is no 0th interval.
  if (number == 0) number = pitch.step + 1;

  std::string prefix = *pitch.dir == Direction::Descending ? "-" : "";
  return prefix + std::to_string(number) + altToQuality(typeOfStep(pitch.step), pitch.alt);
}

IntervalInfo fromCoordinates(const Coordinates& coord, bool force_descending) {
  int fifths = coordinateFifths(coord);
  int octaves = coordinateOctaves(coord).value_or(0);

  long long size = 7LL * fifths + 12LL * octaves;
  Direction dir = (force_descending || size < 0) ? Direction::Descending : Direction::Ascending;
  std::optional<PitchInfo> pitch = pitchFromCoordinates(IntervalCoordinates{fifths, octaves, dir});
  return pitch.has_value() ? get(*pitch) : IntervalInfo{};
}

// ---------------------------------------------------------------------------
// Property accessors
// ---------------------------------------------------------------------------

std::string name(std::string_view interval_name) { return get(interval_name).name; }

int num(std::string_view interval_name) { return get(interval_name).num; }

std::string quality(std::string_view interval_name) { return get(interval_name).quality; }

int semitones(std::string_view interval_name) { return get(interval_name).semitones; }

std::vector<std::string> names() { return {"1P", "2M", "3M", "4P", "5P", "6m", "7m"}; }

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

std::string distance(const NoteInfo& from, const NoteInfo& to) {
  if (from.empty || to.empty) return "";

  int fifths = coordinateFifths(to.coord) - coordinateFifths(from.coord);
  std::optional<int> from_octaves = coordinateOctaves(from.coord);
  std::optional<int> to_octaves = coordinateOctaves(to.coord);
  int octaves = (from_octaves.has_value() && to_octaves.has_value())
                    ? *to_octaves - *from_octaves
                    : -floorDiv(fifths * 7, 12);

  // Same sounding pitch spelled with a lower letter (Fb4 -> E4) descends.
  bool force_descending = to.height == from.height && to.midi.has_value() &&
                          from.octave == to.octave && from.step > to.step;

  return fromCoordinates(NoteCoordinates{fifths, octaves}, force_descending).name;
}

std::string distance(const std::string& from_note, const std::string& to_note) {
  return distance(note::get(from_note), note::get(to_note));
}

std::string simplify(std::string_view interval_name) {
  IntervalInfo info = get(interval_name);
  if (info.empty) return "";
  return std::to_string(info.simple) + info.quality;
}

std::string invert(std::string_view interval_name) {
  IntervalInfo info = get(interval_name);
  if (info.empty) return "";

  PitchInfo inverted;
  inverted.step = (7 - info.step) % 7;
  inverted.alt = info.type == IntervalType::Perfectable ? -info.alt : -(info.alt + 1);
  inverted.oct = info.oct;
  inverted.dir = info.dir;
  return get(inverted).name;
}

std::string fromSemitones(int semitones) {
  long long sign = semitones < 0 ? -1 : 1;
  long long size = std::llabs(static_cast<long long>(semitones));
  long long chroma = size % 12;
  long long octaves = size / 12;
  if (octaves > kMaxOctave) return "";
  long long number = sign * (kSemitoneNumbers[chroma] + 7 * octaves);
  return std::to_string(number) + kSemitoneQualities[chroma];
}

namespace {

/// @brief Combine two intervals' coordinates and name the result.
template <typename Op>
std::string combine(std::string_view lhs, std::string_view rhs, Op op) {
  IntervalInfo first = get(lhs);
  IntervalInfo second = get(rhs);
  if (first.empty || second.empty) return "";

  NoteCoordinates coord{op(first.coord.fifths, second.coord.fifths),
                        op(first.coord.octaves, second.coord.octaves)};
  return fromCoordinates(coord).name;
}

}  // namespace

std::string add(std::string_view lhs, std::string_view rhs) {
  return combine(lhs, rhs, [](int lval, int rval) { return lval + rval; });
}

std::string subtract(std::string_view minuend, std::string_view subtrahend) {
  return combine(minuend, subtrahend, [](int lval, int rval) { return lval - rval; });
}

std::string transposeFifths(std::string_view interval_name, int fifths) {
  IntervalInfo info = get(interval_name);
  if (info.empty) return "";
  long long shifted = static_cast<long long>(info.coord.fifths) + fifths;
  if (shifted < -kMaxFifths || shifted > kMaxFifths) return "";
  return fromCoordinates(NoteCoordinates{static_cast<int>(shifted), info.coord.octaves}).name;
}

}  // namespace interval
}  // namespace tonal
