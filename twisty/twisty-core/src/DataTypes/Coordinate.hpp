#ifndef TWISTY_CORE_COORDINATE_HPP
#define TWISTY_CORE_COORDINATE_HPP

#include <Eigen/Dense>
#include <format>
#include <string>

namespace twisty_core
{

/**
 * @brief A 3D position in scene units, backed by Eigen::Vector3d
 *
 * Scene axes follow the puzzle convention: +X right, +Y away from the viewer,
 * +Z up.
 */
class Coordinate : public Eigen::Vector3d
{
public:
  Coordinate() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Coordinate(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  Coordinate(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  // Construct from Eigen expressions
  template <typename OtherDerived>
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Coordinate& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }
};

}  // namespace twisty_core

// Formats as "(x, y, z)"; accepts an optional precision, e.g. "{:.2}"
template <>
struct std::formatter<twisty_core::Coordinate>
{
  int precision = 3;

  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }
    return it;
  }

  auto format(const twisty_core::Coordinate& coord,
              std::format_context& ctx) const
  {
    return std::format_to(ctx.out(),
                          "({:.{}f}, {:.{}f}, {:.{}f})",
                          coord.x(),
                          precision,
                          coord.y(),
                          precision,
                          coord.z(),
                          precision);
  }
};

#endif  // TWISTY_CORE_COORDINATE_HPP
