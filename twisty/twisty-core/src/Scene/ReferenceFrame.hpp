#ifndef TWISTY_CORE_REFERENCE_FRAME_HPP
#define TWISTY_CORE_REFERENCE_FRAME_HPP

#include <Eigen/Dense>

#include "twisty-core/src/DataTypes/Coordinate.hpp"
#include "twisty-core/src/DataTypes/EulerAngles.hpp"

namespace twisty_core
{

/**
 * @brief A rigid transform (rotation + translation) relative to a parent frame
 *
 * Scene nodes store their local transform as a ReferenceFrame. Frames compose
 * with operator*: if @c parent maps parent-local coordinates to world and
 * @c local maps node-local coordinates to parent-local, then
 * @c parent * @c local maps node-local coordinates to world.
 *
 * The rotation is stored as a matrix rather than as Euler angles so that
 * arbitrary compositions (re-parenting with world transform preservation)
 * round-trip exactly.
 */
class ReferenceFrame
{
public:
  /**
   * @brief Identity frame at the origin
   */
  ReferenceFrame();

  /**
   * @brief Translation only
   * @param origin Origin of this frame in parent coordinates
   */
  explicit ReferenceFrame(const Coordinate& origin);

  /**
   * @brief Translation and rotation
   * @param origin Origin of this frame in parent coordinates
   * @param euler Orientation of this frame relative to the parent
   */
  ReferenceFrame(const Coordinate& origin, const EulerAngles& euler);

  /**
   * @brief Translation and explicit rotation matrix
   * @param origin Origin of this frame in parent coordinates
   * @param rotation Orthonormal rotation from local to parent axes
   */
  ReferenceFrame(const Coordinate& origin, const Eigen::Matrix3d& rotation);

  /**
   * @brief Transform a point from the parent frame to this local frame
   */
  Coordinate globalToLocal(const Coordinate& globalCoord) const;

  /**
   * @brief Transform a point from this local frame to the parent frame
   */
  Coordinate localToGlobal(const Coordinate& localCoord) const;

  /**
   * @brief Batch transform points from this local frame to the parent frame
   *
   * Each column is one point; the matrix is modified in place.
   */
  void localToGlobalBatch(Eigen::Matrix3Xd& localCoords) const;

  /**
   * @brief Rotate a direction vector into the parent frame (no translation)
   */
  Coordinate localToGlobalRelative(const Coordinate& localVector) const;

  /**
   * @brief Compose two frames
   * @param child Frame expressed relative to this frame
   * @return The child frame expressed relative to this frame's parent
   */
  ReferenceFrame operator*(const ReferenceFrame& child) const;

  /**
   * @brief Inverse transform (parent expressed in this frame)
   */
  [[nodiscard]] ReferenceFrame inverse() const;

  /**
   * @brief True when rotation and origin match within a tolerance
   */
  [[nodiscard]] bool isApprox(const ReferenceFrame& other,
                              double tolerance = 1e-9) const;

  void setOrigin(const Coordinate& origin)
  {
    origin_ = origin;
  }

  void setRotation(const EulerAngles& euler);

  const Coordinate& getOrigin() const
  {
    return origin_;
  }

  const Eigen::Matrix3d& getRotation() const
  {
    return rotation_;
  }

private:
  Coordinate origin_;         ///< Origin in parent coordinates
  Eigen::Matrix3d rotation_;  ///< Local-to-parent rotation
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_REFERENCE_FRAME_HPP
