#include "twisty-core/src/Scene/BoundingBox.hpp"

#include <stdexcept>

namespace twisty_core
{

BoundingBox BoundingBox::fromCenter(const Coordinate& center,
                                    const Coordinate& halfExtents)
{
  return BoundingBox{Coordinate{center - halfExtents},
                     Coordinate{center + halfExtents}};
}

BoundingBox BoundingBox::transformed(const ReferenceFrame& frame) const
{
  Eigen::Matrix3Xd corners(3, 8);
  for (int i = 0; i < 8; ++i)
  {
    corners.col(i) << ((i & 1) != 0 ? max.x() : min.x()),
      ((i & 2) != 0 ? max.y() : min.y()), ((i & 4) != 0 ? max.z() : min.z());
  }
  frame.localToGlobalBatch(corners);

  return BoundingBox{Coordinate{corners.rowwise().minCoeff()},
                     Coordinate{corners.rowwise().maxCoeff()}};
}

BoundingBox BoundingBox::shrunk(double inset) const
{
  Coordinate const offset{inset, inset, inset};
  BoundingBox result{Coordinate{min + offset}, Coordinate{max - offset}};
  if ((result.max - result.min).minCoeff() < 0.0)
  {
    throw std::invalid_argument("BoundingBox: inset larger than half extent");
  }
  return result;
}

bool BoundingBox::intersects(const BoundingBox& other) const
{
  for (int axis = 0; axis < 3; ++axis)
  {
    if (max[axis] <= other.min[axis] || other.max[axis] <= min[axis])
    {
      return false;
    }
  }
  return true;
}

Coordinate BoundingBox::center() const
{
  return Coordinate{(min + max) * 0.5};
}

}  // namespace twisty_core
