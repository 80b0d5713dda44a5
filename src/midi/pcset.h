// Pitch-class sets: construction from MIDI lists or chroma strings, and
// scale-constrained lookups (nearest pitch, step and degree indexing).

#ifndef TONAL_MIDI_PCSET_H
#define TONAL_MIDI_PCSET_H

#include <optional>
#include <string_view>
#include <vector>

namespace tonal {
namespace pcset {

/// @brief Pitch class (0-11) of a MIDI number; non-negative for negative input.
int chroma(int midi);

/// @brief Distinct chromas of a MIDI list, sorted ascending.
///
/// Example: {62, 63, 60, 65, 70, 72} -> {0, 2, 3, 5, 10}.
std::vector<int> pcsetFromMidi(const std::vector<int>& midi);

/// @brief Indices of '1' characters in a chroma string ("100100100101").
///
/// Only the first 12 characters are read; shorter strings are read as far
/// as they go. Example: "100100100101" -> {0, 3, 6, 9, 11}.
std::vector<int> pcsetFromChroma(std::string_view chroma);

/// @brief Snap MIDI numbers to the nearest pitch of a set.
///
/// The search widens one semitone at a time and checks the upward candidate
/// before the downward one, so ties resolve upward.
/// @code
///   PcsetNearest nearest(pcsetFromChroma("100101010010"));
///   nearest(37);  // -> 36
///   nearest(38);  // -> 39
/// @endcode
class PcsetNearest {
 public:
  /// @param notes MIDI numbers or chromas; reduced to a pcset.
  explicit PcsetNearest(const std::vector<int>& notes);

  /// @return Nearest MIDI number, or std::nullopt when the set is empty or
  ///         the nearest pitch does not fit in an int.
  std::optional<int> operator()(int midi) const;

 private:
  bool contains_[12] = {};
  bool empty_ = true;
};

/// @brief Walk a pcset as a scale rooted at a tonic.
///
/// Step 0 is the tonic; each len(set) steps up or down shift one octave.
/// For a major set on 60: steps 0..7 -> 60 62 64 65 67 69 71 72,
/// steps -1..-7 -> 59 57 55 53 52 50 48.
class PcsetSteps {
 public:
  /// @param notes MIDI numbers or chromas relative to the tonic.
  /// @param tonic MIDI number of step 0.
  PcsetSteps(const std::vector<int>& notes, int tonic);

  /// @return MIDI number at the step, or std::nullopt when the set is empty
  ///         or the pitch does not fit in an int.
  std::optional<int> operator()(int step) const;

 private:
  std::vector<int> set_;
  int tonic_ = 0;
};

/// @brief 1-indexed scale degrees over PcsetSteps.
///
/// Degree 1 is the tonic, degree 0 has no meaning, degree -1 is one step
/// below the tonic.
class PcsetDegrees {
 public:
  PcsetDegrees(const std::vector<int>& notes, int tonic);

  /// @return MIDI number at the degree, std::nullopt for degree 0.
  std::optional<int> operator()(int degree) const;

 private:
  PcsetSteps steps_;
};

}  // namespace pcset
}  // namespace tonal

#endif  // TONAL_MIDI_PCSET_H
