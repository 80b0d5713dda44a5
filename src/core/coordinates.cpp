// Implementation of coordinate variant accessors.

#include "core/coordinates.h"

#include <type_traits>

namespace tonal {

int coordinateFifths(const Coordinates& coord) {
  return std::visit([](const auto& value) { return value.fifths; }, coord);
}

std::optional<int> coordinateOctaves(const Coordinates& coord) {
  return std::visit(
      [](const auto& value) -> std::optional<int> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, PitchClassCoordinates>) {
          return std::nullopt;
        } else {
          return value.octaves;
        }
      },
      coord);
}

}  // namespace tonal
