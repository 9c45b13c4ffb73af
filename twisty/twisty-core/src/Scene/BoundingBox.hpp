#ifndef TWISTY_CORE_BOUNDING_BOX_HPP
#define TWISTY_CORE_BOUNDING_BOX_HPP

#include "twisty-core/src/DataTypes/Coordinate.hpp"
#include "twisty-core/src/Scene/ReferenceFrame.hpp"

namespace twisty_core
{

/**
 * @brief Axis-aligned box given by its minimum and maximum corners
 */
struct BoundingBox
{
  Coordinate min;
  Coordinate max;

  /**
   * @brief Box of the given half extents around a center point
   */
  static BoundingBox fromCenter(const Coordinate& center,
                                const Coordinate& halfExtents);

  /**
   * @brief Axis-aligned box enclosing this box after a frame transform
   *
   * Transforms all eight corners and takes their extent.
   */
  [[nodiscard]] BoundingBox transformed(const ReferenceFrame& frame) const;

  /**
   * @brief Box moved inward by @p inset on every side
   * @throws std::invalid_argument if the inset would invert the box
   */
  [[nodiscard]] BoundingBox shrunk(double inset) const;

  /**
   * @brief Strict overlap test; boxes that only share a face do not overlap
   */
  [[nodiscard]] bool intersects(const BoundingBox& other) const;

  [[nodiscard]] Coordinate center() const;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_BOUNDING_BOX_HPP
