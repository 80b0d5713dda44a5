/// @file
/// @brief Pitch-class set construction and scale-constrained lookups.

#include "midi/pcset.h"

#include <algorithm>
#include <limits>

#include "core/pitch.h"

namespace tonal {
namespace pcset {

namespace {

/// @brief Narrow a 64-bit MIDI result, std::nullopt when it does not fit.
std::optional<int> toInt(long long value) {
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

}  // namespace

int chroma(int midi) { return floorMod(midi, 12); }

std::vector<int> pcsetFromMidi(const std::vector<int>& midi) {
  std::vector<int> result;
  result.reserve(midi.size());
  for (int note : midi) {
    result.push_back(chroma(note));
  }
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

std::vector<int> pcsetFromChroma(std::string_view chroma) {
  std::vector<int> result;
  size_t len = std::min<size_t>(chroma.size(), 12);
  for (size_t idx = 0; idx < len; ++idx) {
    if (chroma[idx] == '1') {
      result.push_back(static_cast<int>(idx));
    }
  }
  return result;
}

// ---------------------------------------------------------------------------
// PcsetNearest
// ---------------------------------------------------------------------------

PcsetNearest::PcsetNearest(const std::vector<int>& notes) {
  for (int pitch_class : pcsetFromMidi(notes)) {
    contains_[pitch_class] = true;
    empty_ = false;
  }
}

std::optional<int> PcsetNearest::operator()(int midi) const {
  if (empty_) return std::nullopt;

  int base = chroma(midi);
  for (int radius = 0; radius < 12; ++radius) {
    if (contains_[(base + radius) % 12]) return toInt(static_cast<long long>(midi) + radius);
    if (contains_[(base - radius + 12) % 12]) return toInt(static_cast<long long>(midi) - radius);
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// PcsetSteps / PcsetDegrees
// ---------------------------------------------------------------------------

PcsetSteps::PcsetSteps(const std::vector<int>& notes, int tonic)
    : set_(pcsetFromMidi(notes)), tonic_(tonic) {}

std::optional<int> PcsetSteps::operator()(int step) const {
  if (set_.empty()) return std::nullopt;

  int len = static_cast<int>(set_.size());
  int index = floorMod(step, len);
  int octaves = floorDiv(step, len);
  return toInt(set_[static_cast<size_t>(index)] + 12LL * octaves + tonic_);
}

PcsetDegrees::PcsetDegrees(const std::vector<int>& notes, int tonic)
    : steps_(notes, tonic) {}

std::optional<int> PcsetDegrees::operator()(int degree) const {
  if (degree == 0) return std::nullopt;
  return steps_(degree > 0 ? degree - 1 : degree);
}

}  // namespace pcset
}  // namespace tonal
