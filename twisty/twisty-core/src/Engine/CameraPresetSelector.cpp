#include "twisty-core/src/Engine/CameraPresetSelector.hpp"

namespace twisty_core
{

std::optional<CameraPreset> CameraPresetSelector::select(
  char slot,
  const EulerAngles& current)
{
  switch (slot)
  {
    case '1':
      return CameraPreset{"Front", EulerAngles::fromDegrees(0.0, 0.0, 0.0)};
    case '2':
      return CameraPreset{"Back", EulerAngles::fromDegrees(0.0, 180.0, 180.0)};
    case '3':
      return CameraPreset{"Left", EulerAngles::fromDegrees(90.0, 0.0, 0.0)};
    case '4':
      return CameraPreset{"Right", EulerAngles::fromDegrees(-90.0, 0.0, 0.0)};
    case '5':
      return CameraPreset{"Top", EulerAngles::fromDegrees(0.0, 90.0, 0.0)};
    case '6':
      return CameraPreset{"Bottom", EulerAngles::fromDegrees(0.0, -90.0, 0.0)};
    case '7':
    {
      EulerAngles opposite = current;
      opposite.roll -= Angle::fromDegrees(90.0);
      return CameraPreset{"Opposite side", opposite};
    }
    default:
      return std::nullopt;
  }
}

}  // namespace twisty_core
