#include "twisty-core/src/DataTypes/EulerAngles.hpp"

namespace twisty_core
{

namespace
{

Eigen::Matrix3d rotationAboutX(const Angle& angle)
{
  double const c = angle.cos();
  double const s = angle.sin();
  Eigen::Matrix3d m;
  m << 1.0, 0.0, 0.0,
       0.0, c, -s,
       0.0, s, c;
  return m;
}

Eigen::Matrix3d rotationAboutY(const Angle& angle)
{
  double const c = angle.cos();
  double const s = angle.sin();
  Eigen::Matrix3d m;
  m << c, 0.0, s,
       0.0, 1.0, 0.0,
       -s, 0.0, c;
  return m;
}

Eigen::Matrix3d rotationAboutZ(const Angle& angle)
{
  double const c = angle.cos();
  double const s = angle.sin();
  Eigen::Matrix3d m;
  m << c, -s, 0.0,
       s, c, 0.0,
       0.0, 0.0, 1.0;
  return m;
}

}  // namespace

EulerAngles EulerAngles::fromDegrees(double heading, double pitch, double roll)
{
  return EulerAngles{Angle::fromDegrees(heading),
                     Angle::fromDegrees(pitch),
                     Angle::fromDegrees(roll)};
}

Eigen::Matrix3d EulerAngles::toRotationMatrix() const
{
  return rotationAboutZ(heading) * rotationAboutX(pitch) * rotationAboutY(roll);
}

}  // namespace twisty_core
