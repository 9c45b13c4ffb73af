#ifndef TWISTY_CORE_EULER_ANGLES_HPP
#define TWISTY_CORE_EULER_ANGLES_HPP

#include <Eigen/Dense>

#include "twisty-core/src/DataTypes/Angle.hpp"

namespace twisty_core
{

/**
 * @brief Heading/pitch/roll orientation
 *
 * - Heading: rotation about +Z (up)
 * - Pitch: rotation about +X (right)
 * - Roll: rotation about +Y (depth)
 *
 * The combined rotation applies roll first, then pitch, then heading:
 * R = Rz(heading) * Rx(pitch) * Ry(roll).
 */
struct EulerAngles
{
  Angle heading;
  Angle pitch;
  Angle roll;

  static EulerAngles fromDegrees(double heading, double pitch, double roll);

  /**
   * @brief Rotation matrix for this orientation
   *
   * Sines and cosines of exact quarter turns are snapped, so multiples of 90
   * degrees produce matrices with entries in {-1, 0, 1}.
   */
  [[nodiscard]] Eigen::Matrix3d toRotationMatrix() const;

  EulerAngles operator*(double scalar) const
  {
    return EulerAngles{heading * scalar, pitch * scalar, roll * scalar};
  }

  bool operator==(const EulerAngles& other) const
  {
    return heading == other.heading && pitch == other.pitch &&
           roll == other.roll;
  }
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_EULER_ANGLES_HPP
