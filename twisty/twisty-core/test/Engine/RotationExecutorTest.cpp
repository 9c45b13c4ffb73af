// Ticket: 0001_face_turn_engine

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <set>

#include "twisty-core/test/Helpers/PuzzleHarness.hpp"

using namespace twisty_core;
using twisty_core::test::approxEqual;
using twisty_core::test::headingQuarterTurn;
using twisty_core::test::PuzzleHarness;
using std::chrono::milliseconds;

namespace
{

std::set<NodeId> topLayer(const PuzzleHarness& h)
{
  std::set<NodeId> layer;
  for (NodeId const cubie : h.assembly.cubies())
  {
    if (std::abs(h.scene.worldFrame(cubie).getOrigin().z() - 1.0) < 1e-9)
    {
      layer.insert(cubie);
    }
  }
  return layer;
}

}  // anonymous namespace

TEST(RotationExecutorTest, Instant_CompletesBeforeReturning)
{
  PuzzleHarness h;
  h.executor.setAnimationEnabled(false);
  auto const before = h.positions();
  bool completed = false;

  h.executor.execute(FaceId::Top, 1, topLayer(h), [&completed]() { completed = true; });

  EXPECT_TRUE(completed);
  EXPECT_EQ(h.executor.state(), RotationExecutor::State::Idle);
  EXPECT_EQ(h.executor.rotationsExecuted(), 1u);
  EXPECT_TRUE(h.allCubiesUnderRoot());
  EXPECT_TRUE(h.timeline.isIdle());

  for (const auto& [name, position] : h.positions())
  {
    Coordinate const& start = before.at(name);
    Coordinate const expected =
      std::abs(start.z() - 1.0) < 1e-9 ? headingQuarterTurn(start) : start;
    EXPECT_TRUE(approxEqual(position, expected)) << name;
  }
}

TEST(RotationExecutorTest, Animated_GroupsUnderPivotUntilComplete)
{
  PuzzleHarness h;
  auto const layer = topLayer(h);
  NodeId const pivot = h.registry.face(FaceId::Top).pivot;
  bool completed = false;

  h.executor.execute(FaceId::Top, 1, layer, [&completed]() { completed = true; });

  EXPECT_EQ(h.executor.state(), RotationExecutor::State::Rotating);
  for (NodeId const cubie : layer)
  {
    EXPECT_EQ(h.scene.parent(cubie), pivot);
  }

  h.timeline.update(milliseconds{140});
  EXPECT_FALSE(completed);
  EXPECT_NEAR(h.scene.localFrame(pivot).getRotation()(0, 0),
              std::cos(std::numbers::pi / 4.0),
              1e-9);

  h.timeline.update(milliseconds{280});
  EXPECT_TRUE(completed);
  EXPECT_EQ(h.executor.state(), RotationExecutor::State::Idle);
  EXPECT_TRUE(h.allCubiesUnderRoot());
}

TEST(RotationExecutorTest, OppositeDirections_CancelOut)
{
  PuzzleHarness h;
  h.executor.setAnimationEnabled(false);
  auto const before = h.positions();

  std::set<NodeId> left;
  for (NodeId const cubie : h.assembly.cubies())
  {
    if (std::abs(h.scene.worldFrame(cubie).getOrigin().x() + 1.0) < 1e-9)
    {
      left.insert(cubie);
    }
  }
  ASSERT_EQ(left.size(), 9u);

  h.executor.execute(FaceId::Left, 1, left, nullptr);
  h.executor.execute(FaceId::Left, -1, left, nullptr);

  for (const auto& [name, position] : h.positions())
  {
    EXPECT_TRUE(approxEqual(position, before.at(name))) << name;
  }
  for (NodeId const cubie : left)
  {
    EXPECT_TRUE(h.scene.worldFrame(cubie).getRotation().isIdentity(1e-12));
  }
}

TEST(RotationExecutorTest, ExecuteWhileRotating_Throws)
{
  PuzzleHarness h;
  h.executor.execute(FaceId::Top, 1, topLayer(h), nullptr);

  EXPECT_THROW(h.executor.execute(FaceId::Bottom, 1, {}, nullptr),
               std::logic_error);
}

TEST(RotationExecutorTest, InvalidDirection_Throws)
{
  PuzzleHarness h;
  EXPECT_THROW(h.executor.execute(FaceId::Top, 2, topLayer(h), nullptr),
               std::invalid_argument);
  EXPECT_EQ(h.executor.state(), RotationExecutor::State::Idle);
}

TEST(RotationExecutorTest, StartOfTurn_ClearsResidualPivotTransform)
{
  PuzzleHarness h;
  h.executor.setAnimationEnabled(false);
  NodeId const pivot = h.registry.face(FaceId::Top).pivot;

  h.executor.execute(FaceId::Top, 1, topLayer(h), nullptr);
  EXPECT_FALSE(h.scene.localFrame(pivot).getRotation().isIdentity(1e-12));

  // The second turn starts from identity, so two turns make a half turn
  auto const before = h.positions();
  h.executor.execute(FaceId::Top, 1, topLayer(h), nullptr);

  for (const auto& [name, position] : h.positions())
  {
    Coordinate const& start = before.at(name);
    Coordinate const expected =
      std::abs(start.z() - 1.0) < 1e-9 ? headingQuarterTurn(start) : start;
    EXPECT_TRUE(approxEqual(position, expected)) << name;
  }
}
