#include <gtest/gtest.h>

#include <numbers>

#include "twisty-core/src/DataTypes/Angle.hpp"
#include "twisty-core/src/DataTypes/EulerAngles.hpp"

using namespace twisty_core;

// ============================================================================
// Angle
// ============================================================================

TEST(AngleTest, FromDegrees_ConvertsToRadians)
{
  auto const angle = Angle::fromDegrees(90.0);
  EXPECT_NEAR(angle.getRad(), std::numbers::pi / 2.0, 1e-12);
  EXPECT_NEAR(angle.toDeg(), 90.0, 1e-12);
}

TEST(AngleTest, Normalization_WrapsIntoHalfOpenRange)
{
  EXPECT_NEAR(Angle::fromDegrees(270.0).toDeg(), -90.0, 1e-9);
  EXPECT_NEAR(Angle::fromDegrees(-450.0).toDeg(), -90.0, 1e-9);
  EXPECT_NEAR(
    Angle::fromDegrees(-90.0, Angle::Norm::TWO_PI).toDeg(), 270.0, 1e-9);
}

TEST(AngleTest, RawValue_IsNotWrapped)
{
  auto const angle = Angle::fromDegrees(450.0);
  EXPECT_NEAR(angle.getRawRad(), 2.5 * std::numbers::pi, 1e-12);
}

TEST(AngleTest, QuarterTurns_SnapSineAndCosine)
{
  for (int quarter = -8; quarter <= 8; ++quarter)
  {
    auto const angle = Angle::fromDegrees(90.0 * quarter);
    double const c = angle.cos();
    double const s = angle.sin();
    EXPECT_TRUE(c == 0.0 || c == 1.0 || c == -1.0) << "quarter " << quarter;
    EXPECT_TRUE(s == 0.0 || s == 1.0 || s == -1.0) << "quarter " << quarter;
  }
}

TEST(AngleTest, Equality_TreatsFullTurnsAsEqual)
{
  EXPECT_EQ(Angle::fromDegrees(180.0), Angle::fromDegrees(-180.0));
  EXPECT_EQ(Angle::fromDegrees(10.0), Angle::fromDegrees(370.0));
  EXPECT_NE(Angle::fromDegrees(10.0), Angle::fromDegrees(-10.0));
}

TEST(AngleTest, Arithmetic_CombinesRawValues)
{
  auto const a = Angle::fromDegrees(30.0);
  auto const b = Angle::fromDegrees(60.0);

  EXPECT_NEAR((a + b).toDeg(), 90.0, 1e-9);
  EXPECT_NEAR((a - b).toDeg(), -30.0, 1e-9);
  EXPECT_NEAR((a * 3.0).toDeg(), 90.0, 1e-9);
  EXPECT_NEAR((2.0 * a).toDeg(), 60.0, 1e-9);
  EXPECT_NEAR((-a).toDeg(), -30.0, 1e-9);
}

// ============================================================================
// EulerAngles
// ============================================================================

TEST(EulerAnglesTest, Zero_IsIdentity)
{
  EXPECT_TRUE(EulerAngles{}.toRotationMatrix().isIdentity(0.0));
}

TEST(EulerAnglesTest, Heading_RotatesAboutUpAxis)
{
  // Negative heading turns +X toward -Y
  Eigen::Matrix3d const r =
    EulerAngles::fromDegrees(-90.0, 0.0, 0.0).toRotationMatrix();

  Eigen::Vector3d const x = r * Eigen::Vector3d::UnitX();
  Eigen::Vector3d const z = r * Eigen::Vector3d::UnitZ();
  EXPECT_TRUE(x.isApprox(Eigen::Vector3d{0.0, -1.0, 0.0}));
  EXPECT_TRUE(z.isApprox(Eigen::Vector3d::UnitZ()));
}

TEST(EulerAnglesTest, Pitch_RotatesAboutRightAxis)
{
  Eigen::Matrix3d const r =
    EulerAngles::fromDegrees(0.0, 90.0, 0.0).toRotationMatrix();

  Eigen::Vector3d const x = r * Eigen::Vector3d::UnitX();
  Eigen::Vector3d const y = r * Eigen::Vector3d::UnitY();
  EXPECT_TRUE(x.isApprox(Eigen::Vector3d::UnitX()));
  EXPECT_TRUE(y.isApprox(Eigen::Vector3d::UnitZ()));
}

TEST(EulerAnglesTest, Roll_RotatesAboutDepthAxis)
{
  Eigen::Matrix3d const r =
    EulerAngles::fromDegrees(0.0, 0.0, 90.0).toRotationMatrix();

  Eigen::Vector3d const y = r * Eigen::Vector3d::UnitY();
  Eigen::Vector3d const z = r * Eigen::Vector3d::UnitZ();
  EXPECT_TRUE(y.isApprox(Eigen::Vector3d::UnitY()));
  EXPECT_TRUE(z.isApprox(Eigen::Vector3d::UnitX()));
}

TEST(EulerAnglesTest, Scaling_ByMinusOne_GivesInverseRotation)
{
  auto const euler = EulerAngles::fromDegrees(0.0, 90.0, 0.0);

  Eigen::Matrix3d const product =
    euler.toRotationMatrix() * (euler * -1.0).toRotationMatrix();
  EXPECT_TRUE(product.isIdentity(1e-12));
}

TEST(EulerAnglesTest, RotationMatrix_IsOrthonormal)
{
  Eigen::Matrix3d const r =
    EulerAngles::fromDegrees(37.0, -12.5, 101.0).toRotationMatrix();

  EXPECT_TRUE((r * r.transpose()).isIdentity(1e-12));
  EXPECT_NEAR(r.determinant(), 1.0, 1e-12);
}
