// Note names: parsing into NoteInfo descriptors, the name cache, and
// spelling-aware operations (simplify, enharmonic, transpose, sort).

#ifndef TONAL_NOTE_NOTE_H
#define TONAL_NOTE_NOTE_H

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/coordinates.h"

namespace tonal {

/// @brief Parsed note descriptor.
///
/// Two spellings of the same key (C#4, Db4) are distinct descriptors even
/// though chroma and midi match. Invalid input yields empty == true with
/// every other field defaulted.
struct NoteInfo {
  bool empty = true;
  std::string name;         ///< Canonical name, e.g. "C#4", "F##".
  std::string pitch_class;  ///< Letter + accidentals, e.g. "C#".
  std::string letter;       ///< Uppercase letter "A".."G".
  int step = 0;             ///< Letter index, C=0 .. B=6.
  std::string accidentals;  ///< Run of '#' or 'b'.
  int alteration = 0;       ///< Sharps minus flats.
  std::optional<int> octave;
  int chroma = 0;           ///< 0-11.
  std::optional<int> midi;  ///< Present only with octave and in [0, 127].
  int height = 0;           ///< Ordering key; pitch classes sort below notes.
  std::optional<double> frequency;  ///< Hz at A4 = 440, octave required.
  Coordinates coord;        ///< Pitch-class or note coordinates.
};

/// @brief Append-only cache of parsed note names.
///
/// Keyed by the exact input string (no normalization: "c4" and "C4" are two
/// entries). Entries are never removed, so returned references stay valid
/// for the lifetime of the cache. Reads take a shared lock; a miss parses
/// outside the lock and inserts under an exclusive lock, keeping whichever
/// value landed first.
class NoteCache {
 public:
  NoteCache() = default;
  NoteCache(const NoteCache&) = delete;
  NoteCache& operator=(const NoteCache&) = delete;

  /// @brief Get or parse the descriptor for a note name.
  const NoteInfo& get(const std::string& name);

  /// @brief Number of cached names.
  size_t size() const;

  /// @brief Process-wide cache used by the tonal::note free functions.
  /// Created on first use and kept until process exit.
  static NoteCache& shared();

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, NoteInfo> entries_;
};

namespace note {

/// Sort direction for sortedNames().
enum class SortOrder : uint8_t {
  Ascending,
  Descending
};

/// @brief Parse a note name without touching any cache.
NoteInfo parse(std::string_view text);

/// @brief Cached parse through NoteCache::shared().
/// @code
///   note::get("C4").midi;   // -> 60
///   note::get("fx4").name;  // -> "F##4"
/// @endcode
const NoteInfo& get(const std::string& name);

// ---------------------------------------------------------------------------
// Property accessors
// ---------------------------------------------------------------------------

std::string name(const std::string& note_name);
std::string pitchClass(const std::string& note_name);
std::string accidentals(const std::string& note_name);
std::optional<int> octave(const std::string& note_name);
std::optional<int> midi(const std::string& note_name);
std::optional<double> freq(const std::string& note_name);

/// @return Chroma 0-11, std::nullopt for invalid names.
std::optional<int> chroma(const std::string& note_name);

// ---------------------------------------------------------------------------
// Construction from numbers
// ---------------------------------------------------------------------------

/// @brief Flat-spelled name of a MIDI number ("Db4"); "" if out of range.
std::string fromMidi(int midi);
std::string fromMidi(double midi);

/// @brief Sharp-spelled name of a MIDI number ("C#4").
std::string fromMidiSharps(int midi);
std::string fromMidiSharps(double midi);

/// @brief Nearest flat-spelled note of a frequency (440 -> "A4").
std::string fromFreq(double frequency);

/// @brief Nearest sharp-spelled note of a frequency (550 -> "C#5").
std::string fromFreqSharps(double frequency);

// ---------------------------------------------------------------------------
// Spelling
// ---------------------------------------------------------------------------

/// @brief Respell with the fewest accidentals ("C###" -> "D#", "B#4" -> "C5").
///
/// Keeps sharps when the input was sharp, flats otherwise. Returns a bare
/// pitch class when the note has no valid MIDI number. "" if invalid.
std::string simplify(const std::string& note_name);

/// @brief Enharmonic respelling ("C#" -> "Db", "B#4" -> "C5").
/// @param note_name Source note.
/// @param dest_pitch_class Target spelling ("E#"); empty picks the opposite
///        accidental direction.
/// @return "" if invalid, if the target has a different chroma, or if the
///         octave would move past kMaxOctave.
std::string enharmonic(const std::string& note_name,
                       const std::string& dest_pitch_class = "");

// ---------------------------------------------------------------------------
// Transposition and distance
// ---------------------------------------------------------------------------

/// @brief Transpose by an interval ("D", "3M" -> "F#").
/// @return "" if either input is invalid or the result would exceed
///         kMaxAlteration accidentals or kMaxOctave.
std::string transpose(const std::string& note_name, const std::string& interval_name);

/// @brief Transpose by a number of perfect fifths ("G", 3 -> "E").
/// @return "" if invalid or out of range, as for transpose().
std::string transposeFifths(const std::string& note_name, int fifths);

/// @brief Interval between two notes ("C", "D" -> "2M").
std::string distance(const std::string& from, const std::string& to);

/// @brief Transposes any note by a fixed interval.
class TransposeBy {
 public:
  explicit TransposeBy(std::string interval_name)
      : interval_name_(std::move(interval_name)) {}

  std::string operator()(const std::string& note_name) const {
    return transpose(note_name, interval_name_);
  }

 private:
  std::string interval_name_;
};

/// @brief Transposes a fixed note by any interval.
class TransposeFrom {
 public:
  explicit TransposeFrom(std::string note_name)
      : note_name_(std::move(note_name)) {}

  std::string operator()(const std::string& interval_name) const {
    return transpose(note_name_, interval_name);
  }

 private:
  std::string note_name_;
};

// ---------------------------------------------------------------------------
// Collections
// ---------------------------------------------------------------------------

/// @brief The seven natural pitch classes "C".."B".
std::vector<std::string> names();

/// @brief Normalized names of the valid entries (invalid ones dropped).
std::vector<std::string> names(const std::vector<std::string>& items);

/// @brief Valid names sorted by height (stable for equal heights).
std::vector<std::string> sortedNames(const std::vector<std::string>& notes,
                                     SortOrder order = SortOrder::Ascending);

/// @brief Ascending sort with duplicate names removed.
std::vector<std::string> sortedUniqNames(const std::vector<std::string>& notes);

}  // namespace note
}  // namespace tonal

#endif  // TONAL_NOTE_NOTE_H
