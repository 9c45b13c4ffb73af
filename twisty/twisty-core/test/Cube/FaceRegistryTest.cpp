// Ticket: 0001_face_turn_engine

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "twisty-core/src/Cube/CubeAssembly.hpp"
#include "twisty-core/src/Cube/FaceRegistry.hpp"

using namespace twisty_core;

class FaceRegistryTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    assembly = std::make_unique<CubeAssembly>(scene);
  }

  SceneGraph scene;
  std::unique_ptr<CubeAssembly> assembly;
};

// ============================================================================
// Default table
// ============================================================================

TEST_F(FaceRegistryTest, DefaultTable_Quorums)
{
  FaceRegistry const registry{defaultFaceTable(), scene};

  for (FaceId const face : {FaceId::Top,
                            FaceId::Bottom,
                            FaceId::Left,
                            FaceId::Right,
                            FaceId::Front,
                            FaceId::Back})
  {
    EXPECT_EQ(registry.face(face).quorum, 9u) << toString(face);
  }
  for (FaceId const face : {FaceId::CenterVertical,
                            FaceId::CenterHorizontal,
                            FaceId::CenterDouble})
  {
    EXPECT_EQ(registry.face(face).quorum, 8u) << toString(face);
  }
}

TEST_F(FaceRegistryTest, DefaultTable_BindsPivotAndVolume)
{
  FaceRegistry const registry{defaultFaceTable(), scene};

  const Face& top = registry.face(FaceId::Top);
  EXPECT_EQ(scene.name(top.pivot), "TOP_SIDE");
  EXPECT_EQ(scene.name(top.volume), "TOP_SIDE_collider");
  EXPECT_EQ(scene.parent(top.volume), top.pivot);
  EXPECT_EQ(top.rotation, EulerAngles::fromDegrees(-90.0, 0.0, 0.0));
}

TEST_F(FaceRegistryTest, FaceForKey_IgnoresCase)
{
  FaceRegistry const registry{defaultFaceTable(), scene};

  EXPECT_EQ(registry.faceForKey('t'), FaceId::Top);
  EXPECT_EQ(registry.faceForKey('T'), FaceId::Top);
  EXPECT_EQ(registry.faceForKey('d'), FaceId::Bottom);
  EXPECT_EQ(registry.faceForKey('H'), FaceId::CenterHorizontal);
  EXPECT_EQ(registry.faceForKey('c'), FaceId::CenterDouble);
  EXPECT_FALSE(registry.faceForKey('x').has_value());
  EXPECT_FALSE(registry.faceForKey('1').has_value());
}

TEST_F(FaceRegistryTest, FaceForVolume_MapsColliderToFace)
{
  FaceRegistry const registry{defaultFaceTable(), scene};

  for (const auto& face : registry.faces())
  {
    EXPECT_EQ(registry.faceForVolume(face.volume), face.id);
  }
  EXPECT_FALSE(registry.faceForVolume(assembly->cubeRoot()).has_value());
}

TEST_F(FaceRegistryTest, CommandKeys_BothCasesOfEveryFace)
{
  FaceRegistry const registry{defaultFaceTable(), scene};

  auto const keys = registry.commandKeys();
  ASSERT_EQ(keys.size(), 18u);
  EXPECT_EQ(keys[0], 't');
  EXPECT_EQ(keys[1], 'T');
  for (char const key : {'t', 'd', 'l', 'r', 'f', 'b', 'v', 'h', 'c'})
  {
    EXPECT_NE(std::ranges::find(keys, key), keys.end()) << key;
  }
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(FaceRegistryTest, DuplicateKey_Throws)
{
  auto table = defaultFaceTable();
  table[1].key = 'T';
  EXPECT_THROW(FaceRegistry(table, scene), std::invalid_argument);
}

TEST_F(FaceRegistryTest, DuplicateFace_Throws)
{
  auto table = defaultFaceTable();
  table[1].id = FaceId::Top;
  EXPECT_THROW(FaceRegistry(table, scene), std::invalid_argument);
}

TEST_F(FaceRegistryTest, MissingFace_Throws)
{
  auto table = defaultFaceTable();
  table.pop_back();
  EXPECT_THROW(FaceRegistry(table, scene), std::invalid_argument);
}

TEST_F(FaceRegistryTest, NonLetterKey_Throws)
{
  auto table = defaultFaceTable();
  table[0].key = '1';
  EXPECT_THROW(FaceRegistry(table, scene), std::invalid_argument);
}

TEST_F(FaceRegistryTest, ZeroQuorum_Throws)
{
  auto table = defaultFaceTable();
  table[3].quorum = 0;
  EXPECT_THROW(FaceRegistry(table, scene), std::invalid_argument);
}

TEST_F(FaceRegistryTest, MissingPivot_Throws)
{
  auto table = defaultFaceTable();
  table[2].pivotName = "NO_SUCH_SIDE";
  EXPECT_THROW(FaceRegistry(table, scene), std::invalid_argument);
}

TEST_F(FaceRegistryTest, VolumeWithoutBounds_Throws)
{
  auto table = defaultFaceTable();
  table[2].volumeName = "LEFT_SIDE";
  EXPECT_THROW(FaceRegistry(table, scene), std::invalid_argument);
}

TEST(FaceRegistryEmptySceneTest, EmptyScene_Throws)
{
  SceneGraph const scene;
  EXPECT_THROW(FaceRegistry(defaultFaceTable(), scene), std::invalid_argument);
}
