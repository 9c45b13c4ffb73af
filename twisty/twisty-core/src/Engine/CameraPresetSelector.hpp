#ifndef TWISTY_CORE_CAMERA_PRESET_SELECTOR_HPP
#define TWISTY_CORE_CAMERA_PRESET_SELECTOR_HPP

#include <optional>
#include <string>

#include "twisty-core/src/DataTypes/EulerAngles.hpp"

namespace twisty_core
{

struct CameraPreset
{
  std::string label;
  EulerAngles orientation;
};

/**
 * @brief Maps preset keys to camera orientations
 *
 * | Key | Label         | (heading, pitch, roll)      |
 * |-----|---------------|-----------------------------|
 * | 1   | Front         | (0, 0, 0)                   |
 * | 2   | Back          | (0, 180, 180)               |
 * | 3   | Left          | (90, 0, 0)                  |
 * | 4   | Right         | (-90, 0, 0)                 |
 * | 5   | Top           | (0, 90, 0)                  |
 * | 6   | Bottom        | (0, -90, 0)                 |
 * | 7   | Opposite side | current with roll - 90      |
 */
class CameraPresetSelector
{
public:
  /**
   * @brief Resolve a preset key against the current camera orientation
   * @return The preset, or nullopt for a key outside '1' to '7'
   */
  [[nodiscard]] static std::optional<CameraPreset> select(
    char slot,
    const EulerAngles& current);
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_CAMERA_PRESET_SELECTOR_HPP
