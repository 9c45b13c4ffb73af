#ifndef TWISTY_CORE_FACE_ID_HPP
#define TWISTY_CORE_FACE_ID_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace twisty_core
{

/**
 * @brief Selectable rotation groups: six outer layers and three center slices
 *
 * Declaration order is also the fixed priority order used to break ties.
 */
enum class FaceId : uint8_t
{
  Top,
  Bottom,
  Left,
  Right,
  Front,
  Back,
  CenterVertical,
  CenterHorizontal,
  CenterDouble
};

inline constexpr size_t kFaceCount = 9;

inline constexpr std::array<FaceId, kFaceCount> kAllFaces{
  FaceId::Top,
  FaceId::Bottom,
  FaceId::Left,
  FaceId::Right,
  FaceId::Front,
  FaceId::Back,
  FaceId::CenterVertical,
  FaceId::CenterHorizontal,
  FaceId::CenterDouble};

constexpr size_t toIndex(FaceId face)
{
  return static_cast<size_t>(face);
}

std::string_view toString(FaceId face);

}  // namespace twisty_core

#endif  // TWISTY_CORE_FACE_ID_HPP
