#include <gtest/gtest.h>

#include "twisty-core/src/Engine/EngineConfig.hpp"

using namespace twisty_core;
using std::chrono::milliseconds;

TEST(EngineConfigTest, Defaults_MatchPuzzleTiming)
{
  EngineConfig const config;

  EXPECT_EQ(config.animation.rotationDuration, milliseconds{280});
  EXPECT_EQ(config.shuffle.minMoves, 30u);
  EXPECT_EQ(config.shuffle.maxMoves, 60u);
  EXPECT_EQ(config.shuffle.leadIn, milliseconds{1000});
  EXPECT_EQ(config.shuffle.moveInterval, milliseconds{150});
  EXPECT_FALSE(config.shuffle.seed.has_value());
  EXPECT_EQ(config.collision.refresh, MembershipRefresh::Invalidate);
  EXPECT_DOUBLE_EQ(config.collision.perturbationOffset, 15.0);
  EXPECT_DOUBLE_EQ(config.collision.colliderInset, 0.2);
  EXPECT_NO_THROW(config.validate());
}

TEST(EngineConfigTest, InvertedMoveRange_Throws)
{
  EngineConfig config;
  config.shuffle.minMoves = 61;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(EngineConfigTest, ZeroMoves_Throws)
{
  EngineConfig config;
  config.shuffle.minMoves = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(EngineConfigTest, NegativeDurations_Throw)
{
  EngineConfig config;
  config.animation.rotationDuration = milliseconds{-1};
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = EngineConfig{};
  config.shuffle.moveInterval = milliseconds{-5};
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(EngineConfigTest, ZeroPerturbation_ThrowsOnlyWhenPerturbing)
{
  EngineConfig config;
  config.collision.perturbationOffset = 0.0;
  EXPECT_NO_THROW(config.validate());

  config.collision.refresh = MembershipRefresh::Perturb;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(EngineConfigTest, OversizedInset_Throws)
{
  EngineConfig config;
  config.collision.colliderInset = 0.5;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(EngineConfigTest, InsetNotExceedingVolumeOverlap_Throws)
{
  EngineConfig config;
  config.collision.colliderInset = 0.1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.layout.volumeOverlap = 0.05;
  EXPECT_NO_THROW(config.validate());

  config.layout.volumeOverlap = -0.05;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}
