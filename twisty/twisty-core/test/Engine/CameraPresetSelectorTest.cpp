#include <gtest/gtest.h>

#include "twisty-core/src/Engine/CameraPresetSelector.hpp"

using namespace twisty_core;

TEST(CameraPresetSelectorTest, FixedPresets_IgnoreCurrentOrientation)
{
  auto const current = EulerAngles::fromDegrees(12.0, 34.0, 56.0);

  auto const back = CameraPresetSelector::select('2', current);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->label, "Back");
  EXPECT_EQ(back->orientation, EulerAngles::fromDegrees(0.0, 180.0, 180.0));

  auto const left = CameraPresetSelector::select('3', current);
  ASSERT_TRUE(left.has_value());
  EXPECT_EQ(left->label, "Left");
  EXPECT_EQ(left->orientation, EulerAngles::fromDegrees(90.0, 0.0, 0.0));
}

TEST(CameraPresetSelectorTest, AllFixedSlots_HaveLabels)
{
  EulerAngles const current{};
  char const* const labels[] = {"Front", "Back", "Left", "Right", "Top", "Bottom"};

  for (int i = 0; i < 6; ++i)
  {
    auto const preset =
      CameraPresetSelector::select(static_cast<char>('1' + i), current);
    ASSERT_TRUE(preset.has_value());
    EXPECT_EQ(preset->label, labels[i]);
  }
}

TEST(CameraPresetSelectorTest, OppositeSide_RollsCurrentOrientation)
{
  auto const current = EulerAngles::fromDegrees(90.0, 0.0, 0.0);

  auto const opposite = CameraPresetSelector::select('7', current);
  ASSERT_TRUE(opposite.has_value());
  EXPECT_EQ(opposite->label, "Opposite side");
  EXPECT_EQ(opposite->orientation, EulerAngles::fromDegrees(90.0, 0.0, -90.0));

  auto const twice = CameraPresetSelector::select('7', opposite->orientation);
  ASSERT_TRUE(twice.has_value());
  EXPECT_EQ(twice->orientation, EulerAngles::fromDegrees(90.0, 0.0, 180.0));
}

TEST(CameraPresetSelectorTest, OtherSlots_ReturnNothing)
{
  EXPECT_FALSE(CameraPresetSelector::select('0', EulerAngles{}).has_value());
  EXPECT_FALSE(CameraPresetSelector::select('8', EulerAngles{}).has_value());
  EXPECT_FALSE(CameraPresetSelector::select('t', EulerAngles{}).has_value());
}
