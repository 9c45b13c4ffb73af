#ifndef TWISTY_CORE_ANGLE_HPP
#define TWISTY_CORE_ANGLE_HPP

#include <cmath>
#include <cstdint>
#include <numbers>

namespace twisty_core
{

static constexpr double RAD_TO_DEG = 180.0 / std::numbers::pi;
static constexpr double DEG_TO_RAD = std::numbers::pi / 180.0;
static constexpr double TWO_PI = 2.0 * std::numbers::pi;

/**
 * @brief An angle stored in radians with lazy normalization
 *
 * The raw value is kept as assigned so that accumulated rotations can be
 * scaled (animation progress) without losing turns. Normalization is applied
 * on read according to the normalization mode.
 */
class Angle
{
public:
  enum class Norm : uint8_t
  {
    PI,     // (-pi, pi]
    TWO_PI  // [0, 2pi)
  };

  Angle() = default;

  explicit Angle(double radians, Norm norm = Norm::PI)
    : rad_{radians}, normalization_{norm}
  {
  }

  static Angle fromRadians(double radians, Norm norm = Norm::PI)
  {
    return Angle{radians, norm};
  }

  static Angle fromDegrees(double degrees, Norm norm = Norm::PI)
  {
    return Angle{degrees * DEG_TO_RAD, norm};
  }

  /**
   * @brief Normalized value in radians
   */
  double getRad() const
  {
    return normalize();
  }

  /**
   * @brief Normalized value in degrees
   */
  double toDeg() const
  {
    return normalize() * RAD_TO_DEG;
  }

  /**
   * @brief Raw (unnormalized) value in radians
   */
  double getRawRad() const
  {
    return rad_;
  }

  /**
   * @brief Cosine, snapped to exact 0/+-1 near quarter turns
   *
   * Quarter turns are applied hundreds of times to the same cubie during a
   * shuffle; snapping keeps the cubie grid exact.
   */
  double cos() const
  {
    return snap(std::cos(rad_));
  }

  /**
   * @brief Sine, snapped to exact 0/+-1 near quarter turns
   */
  double sin() const
  {
    return snap(std::sin(rad_));
  }

  Norm getNormalization() const
  {
    return normalization_;
  }

  Angle operator+(const Angle& other) const
  {
    return Angle{rad_ + other.rad_, normalization_};
  }

  Angle operator-(const Angle& other) const
  {
    return Angle{rad_ - other.rad_, normalization_};
  }

  Angle operator*(double scalar) const
  {
    return Angle{rad_ * scalar, normalization_};
  }

  Angle operator-() const
  {
    return Angle{-rad_, normalization_};
  }

  Angle& operator+=(const Angle& other)
  {
    rad_ += other.rad_;
    return *this;
  }

  Angle& operator-=(const Angle& other)
  {
    rad_ -= other.rad_;
    return *this;
  }

  bool operator==(const Angle& other) const
  {
    // Compare the wrapped difference so that -pi and pi are equal
    return std::abs(Angle{rad_ - other.rad_}.normalize()) < 1e-10;
  }

  bool operator!=(const Angle& other) const
  {
    return !(*this == other);
  }

private:
  static double snap(double value)
  {
    constexpr double kSnapTolerance{1e-12};
    if (std::abs(value) < kSnapTolerance)
    {
      return 0.0;
    }
    if (std::abs(value - 1.0) < kSnapTolerance)
    {
      return 1.0;
    }
    if (std::abs(value + 1.0) < kSnapTolerance)
    {
      return -1.0;
    }
    return value;
  }

  double normalize() const
  {
    double normAngle = rad_;
    switch (normalization_)
    {
      case Norm::PI:
        if (std::abs(normAngle) > std::numbers::pi)
        {
          normAngle = std::fmod(rad_ + std::numbers::pi, TWO_PI);
          if (normAngle < 0.)
          {
            normAngle += TWO_PI;
          }
          normAngle -= std::numbers::pi;
        }
        break;
      case Norm::TWO_PI:
        normAngle = std::fmod(rad_, TWO_PI);
        if (normAngle < 0.0)
        {
          normAngle += TWO_PI;
        }
        break;
    }
    return normAngle;
  }

  // Ground truth, radians
  double rad_{0.0};
  Norm normalization_{Norm::PI};
};

inline Angle operator*(double scalar, const Angle& angle)
{
  return angle * scalar;
}

}  // namespace twisty_core

#endif  // TWISTY_CORE_ANGLE_HPP
