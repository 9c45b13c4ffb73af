#include "twisty-core/src/Scene/ReferenceFrame.hpp"

namespace twisty_core
{

ReferenceFrame::ReferenceFrame()
  : origin_{0.0, 0.0, 0.0}, rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin)
  : origin_{origin}, rotation_{Eigen::Matrix3d::Identity()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const EulerAngles& euler)
  : origin_{origin}, rotation_{euler.toRotationMatrix()}
{
}

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const Eigen::Matrix3d& rotation)
  : origin_{origin}, rotation_{rotation}
{
}

Coordinate ReferenceFrame::globalToLocal(const Coordinate& globalCoord) const
{
  // Translate to frame origin, then rotate to local orientation
  Coordinate translated = globalCoord - origin_;
  return rotation_.transpose() * translated;
}

Coordinate ReferenceFrame::localToGlobal(const Coordinate& localCoord) const
{
  Coordinate rotated = rotation_ * localCoord;
  return rotated + origin_;
}

void ReferenceFrame::localToGlobalBatch(Eigen::Matrix3Xd& localCoords) const
{
  localCoords.applyOnTheLeft(rotation_);
  localCoords.colwise() += static_cast<const Eigen::Vector3d&>(origin_);
}

Coordinate ReferenceFrame::localToGlobalRelative(
  const Coordinate& localVector) const
{
  return rotation_ * localVector;
}

ReferenceFrame ReferenceFrame::operator*(const ReferenceFrame& child) const
{
  return ReferenceFrame{localToGlobal(child.origin_),
                        Eigen::Matrix3d(rotation_ * child.rotation_)};
}

ReferenceFrame ReferenceFrame::inverse() const
{
  Eigen::Matrix3d const inverseRotation = rotation_.transpose();
  return ReferenceFrame{Coordinate{-(inverseRotation * origin_)},
                        inverseRotation};
}

bool ReferenceFrame::isApprox(const ReferenceFrame& other,
                              double tolerance) const
{
  return (origin_ - other.origin_).norm() <= tolerance &&
         (rotation_ - other.rotation_).norm() <= tolerance;
}

void ReferenceFrame::setRotation(const EulerAngles& euler)
{
  rotation_ = euler.toRotationMatrix();
}

}  // namespace twisty_core
