/// @file
/// @brief Note name parsing, caching, respelling, transposition and sorting.

#include "note/note.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <mutex>

#include "core/pitch.h"
#include "core/tokenizer.h"
#include "interval/interval.h"
#include "midi/midi_convert.h"

namespace tonal {

namespace {

/// Heights of octave-less notes are offset by this many octaves down.
constexpr int kPitchClassHeightOctaves = 99;

/// @brief Parse an octave token ("4", "-1") within kMaxOctave.
bool parseOctave(const std::string& token, int& out) {
  const char* last = token.data() + token.size();
  auto result = std::from_chars(token.data(), last, out);
  if (result.ec != std::errc() || result.ptr != last) return false;
  return out >= -kMaxOctave && out <= kMaxOctave;
}

/// @brief Note name at the given coordinates, "" when out of range.
std::string nameAt(const Coordinates& coord) {
  std::optional<PitchInfo> pitch = pitchFromCoordinates(coord);
  return pitch.has_value() ? pitchName(*pitch) : "";
}

}  // namespace

// ---------------------------------------------------------------------------
// NoteCache
// ---------------------------------------------------------------------------

const NoteInfo& NoteCache::get(const std::string& name) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto found = entries_.find(name);
    if (found != entries_.end()) return found->second;
  }

  NoteInfo parsed = note::parse(name);
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto inserted = entries_.try_emplace(name, std::move(parsed));
  return inserted.first->second;
}

size_t NoteCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

NoteCache& NoteCache::shared() {
  static NoteCache cache;
  return cache;
}

namespace note {

NoteInfo parse(std::string_view text) {
  NoteTokens tokens = tokenizeNote(text);
  if (tokens.letter.empty() || !tokens.rest.empty()) return NoteInfo{};

  std::optional<int> oct;
  if (!tokens.octave.empty()) {
    int value = 0;
    if (!parseOctave(tokens.octave, value)) return NoteInfo{};
    oct = value;
  }

  int step = static_cast<int>(std::string_view(kStepLetters).find(tokens.letter[0]));
  int offset = kStepSemitones[step];
  int alt = 0;
  for (char acc : tokens.accidentals) {
    alt += (acc == '#') ? 1 : -1;
  }
  if (alt < -kMaxAlteration || alt > kMaxAlteration) return NoteInfo{};

  NoteInfo info;
  info.empty = false;
  info.letter = tokens.letter;
  info.step = step;
  info.accidentals = tokens.accidentals;
  info.alteration = alt;
  info.pitch_class = tokens.letter + tokens.accidentals;
  info.name = info.pitch_class + tokens.octave;
  info.octave = oct;
  info.chroma = floorMod(offset + alt, 12);

  if (oct.has_value()) {
    info.height = offset + alt + 12 * (*oct + 1);
    info.frequency = tonal::midi::midiToFreq(info.height);
  } else {
    info.height = floorMod(offset + alt, 12) - 12 * kPitchClassHeightOctaves;
  }
  if (tonal::midi::isMidi(info.height) && oct.has_value()) {
    info.midi = info.height;
  }

  PitchInfo pitch;
  pitch.step = step;
  pitch.alt = alt;
  pitch.oct = oct;
  info.coord = pitchToCoordinates(pitch);
  return info;
}

const NoteInfo& get(const std::string& name) { return NoteCache::shared().get(name); }

// ---------------------------------------------------------------------------
// Property accessors
// ---------------------------------------------------------------------------

std::string name(const std::string& note_name) { return get(note_name).name; }

std::string pitchClass(const std::string& note_name) { return get(note_name).pitch_class; }

std::string accidentals(const std::string& note_name) { return get(note_name).accidentals; }

std::optional<int> octave(const std::string& note_name) { return get(note_name).octave; }

std::optional<int> midi(const std::string& note_name) { return get(note_name).midi; }

std::optional<double> freq(const std::string& note_name) { return get(note_name).frequency; }

std::optional<int> chroma(const std::string& note_name) {
  const NoteInfo& info = get(note_name);
  if (info.empty) return std::nullopt;
  return info.chroma;
}

// ---------------------------------------------------------------------------
// Construction from numbers
// ---------------------------------------------------------------------------

std::string fromMidi(int midi) { return tonal::midi::midiToNoteName(midi, false, false); }

std::string fromMidi(double midi) { return tonal::midi::midiToNoteName(midi, false, false); }

std::string fromMidiSharps(int midi) { return tonal::midi::midiToNoteName(midi, true, false); }

std::string fromMidiSharps(double midi) {
  return tonal::midi::midiToNoteName(midi, true, false);
}

std::string fromFreq(double frequency) {
  return tonal::midi::midiToNoteName(tonal::midi::freqToMidi(frequency), false, false);
}

std::string fromFreqSharps(double frequency) {
  return tonal::midi::midiToNoteName(tonal::midi::freqToMidi(frequency), true, false);
}

// ---------------------------------------------------------------------------
// Spelling
// ---------------------------------------------------------------------------

std::string simplify(const std::string& note_name) {
  const NoteInfo& info = get(note_name);
  if (info.empty) return "";

  int value = info.midi.value_or(info.chroma);
  return tonal::midi::midiToNoteName(value, info.alteration > 0, !info.midi.has_value());
}

std::string enharmonic(const std::string& note_name, const std::string& dest_pitch_class) {
  const NoteInfo& src = get(note_name);
  if (src.empty) return "";

  std::string dest_name = dest_pitch_class;
  if (dest_name.empty()) {
    dest_name = tonal::midi::midiToNoteName(src.midi.value_or(src.chroma),
                                            src.alteration < 0, true);
  }
  const NoteInfo& dest = get(dest_name);
  if (dest.empty || dest.chroma != src.chroma) return "";

  if (!src.octave.has_value()) return dest.pitch_class;

  // Respelling across C moves the octave number (B#4 = C5, Cb4 = B3).
  int src_natural = src.chroma - src.alteration;
  int dest_natural = dest.chroma - dest.alteration;
  int oct_offset = 0;
  if (src_natural > 11 || dest_natural < 0) {
    oct_offset = -1;
  } else if (src_natural < 0 || dest_natural > 11) {
    oct_offset = 1;
  }
  int octave = *src.octave + oct_offset;
  if (octave < -kMaxOctave || octave > kMaxOctave) return "";
  return dest.pitch_class + std::to_string(octave);
}

// ---------------------------------------------------------------------------
// Transposition and distance
// ---------------------------------------------------------------------------

std::string transpose(const std::string& note_name, const std::string& interval_name) {
  const NoteInfo& info = get(note_name);
  IntervalInfo ivl = interval::get(interval_name);
  if (info.empty || ivl.empty) return "";

  int fifths = coordinateFifths(info.coord) + ivl.coord.fifths;
  std::optional<int> octaves = coordinateOctaves(info.coord);
  if (!octaves.has_value()) return nameAt(PitchClassCoordinates{fifths});
  return nameAt(NoteCoordinates{fifths, *octaves + ivl.coord.octaves});
}

std::string transposeFifths(const std::string& note_name, int fifths) {
  const NoteInfo& info = get(note_name);
  if (info.empty) return "";

  long long shifted = static_cast<long long>(coordinateFifths(info.coord)) + fifths;
  if (shifted < -kMaxFifths || shifted > kMaxFifths) return "";
  std::optional<int> octaves = coordinateOctaves(info.coord);
  if (!octaves.has_value()) return nameAt(PitchClassCoordinates{static_cast<int>(shifted)});
  return nameAt(NoteCoordinates{static_cast<int>(shifted), *octaves});
}

std::string distance(const std::string& from, const std::string& to) {
  return interval::distance(get(from), get(to));
}

// ---------------------------------------------------------------------------
// Collections
// ---------------------------------------------------------------------------

std::vector<std::string> names() { return {"C", "D", "E", "F", "G", "A", "B"}; }

std::vector<std::string> names(const std::vector<std::string>& items) {
  std::vector<std::string> result;
  for (const auto& item : items) {
    const NoteInfo& info = get(item);
    if (!info.empty) result.push_back(info.name);
  }
  return result;
}

std::vector<std::string> sortedNames(const std::vector<std::string>& notes, SortOrder order) {
  std::vector<const NoteInfo*> valid;
  valid.reserve(notes.size());
  for (const auto& item : notes) {
    const NoteInfo& info = get(item);
    if (!info.empty) valid.push_back(&info);
  }

  std::stable_sort(valid.begin(), valid.end(),
                   [order](const NoteInfo* lhs, const NoteInfo* rhs) {
                     return order == SortOrder::Ascending ? lhs->height < rhs->height
                                                          : lhs->height > rhs->height;
                   });

  std::vector<std::string> result;
  result.reserve(valid.size());
  for (const NoteInfo* info : valid) {
    result.push_back(info->name);
  }
  return result;
}

std::vector<std::string> sortedUniqNames(const std::vector<std::string>& notes) {
  std::vector<std::string> sorted = sortedNames(notes, SortOrder::Ascending);
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
  return sorted;
}

}  // namespace note
}  // namespace tonal
