#include <gtest/gtest.h>

#include "twisty-core/test/Helpers/PuzzleHarness.hpp"

using namespace twisty_core;

class KeyMapTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    assembly = std::make_unique<CubeAssembly>(scene);
    registry = std::make_unique<FaceRegistry>(defaultFaceTable(), scene);
    keyMap = std::make_unique<KeyMap>(*registry);
  }

  SceneGraph scene;
  std::unique_ptr<CubeAssembly> assembly;
  std::unique_ptr<FaceRegistry> registry;
  std::unique_ptr<KeyMap> keyMap;
};

TEST_F(KeyMapTest, LowercaseLetter_TurnsPositive)
{
  const auto& command = keyMap->resolve('t');
  EXPECT_EQ(command.kind, KeyCommand::Kind::Face);
  EXPECT_EQ(command.face, FaceId::Top);
  EXPECT_EQ(command.direction, 1);
}

TEST_F(KeyMapTest, UppercaseLetter_TurnsNegative)
{
  const auto& command = keyMap->resolve('V');
  EXPECT_EQ(command.kind, KeyCommand::Kind::Face);
  EXPECT_EQ(command.face, FaceId::CenterVertical);
  EXPECT_EQ(command.direction, -1);
}

TEST_F(KeyMapTest, EveryCommandKey_ResolvesToItsFace)
{
  for (char const key : registry->commandKeys())
  {
    const auto& command = keyMap->resolve(key);
    ASSERT_EQ(command.kind, KeyCommand::Kind::Face) << key;
    EXPECT_EQ(registry->faceForKey(key), command.face) << key;
  }
}

TEST_F(KeyMapTest, Space_RequestsShuffle)
{
  EXPECT_EQ(keyMap->resolve(' ').kind, KeyCommand::Kind::Shuffle);
}

TEST_F(KeyMapTest, PresetDigits_SelectCamera)
{
  for (char slot = '1'; slot <= '7'; ++slot)
  {
    const auto& command = keyMap->resolve(slot);
    EXPECT_EQ(command.kind, KeyCommand::Kind::CameraPreset) << slot;
    EXPECT_EQ(command.slot, slot);
  }
}

TEST_F(KeyMapTest, UnboundKeys_ResolveToNone)
{
  for (char const key : {'x', 'X', 'q', '0', '8', '9', '\n', '\0'})
  {
    EXPECT_EQ(keyMap->resolve(key).kind, KeyCommand::Kind::None)
      << static_cast<int>(key);
  }
  EXPECT_EQ(keyMap->resolve(static_cast<char>(200)).kind,
            KeyCommand::Kind::None);
}
