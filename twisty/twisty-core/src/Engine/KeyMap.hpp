#ifndef TWISTY_CORE_KEY_MAP_HPP
#define TWISTY_CORE_KEY_MAP_HPP

#include <array>
#include <cstdint>

#include "twisty-core/src/Cube/FaceRegistry.hpp"

namespace twisty_core
{

/**
 * @brief What a single key asks the engine to do
 */
struct KeyCommand
{
  enum class Kind : uint8_t
  {
    None,
    Face,
    CameraPreset,
    Shuffle
  };

  Kind kind{Kind::None};
  FaceId face{FaceId::Top};  // Valid for Kind::Face
  int direction{0};          // +1 lowercase, -1 uppercase; Kind::Face only
  char slot{'\0'};           // Preset key; Kind::CameraPreset only
};

/**
 * @brief Lookup table from input characters to typed commands
 *
 * Resolved once from the face registry: bound letters in either case map to
 * their face, the space character to a shuffle, '1' to '7' to camera presets
 * and everything else to Kind::None.
 */
class KeyMap
{
public:
  static constexpr char kShuffleKey{' '};
  static constexpr char kFirstPresetKey{'1'};
  static constexpr char kLastPresetKey{'7'};

  explicit KeyMap(const FaceRegistry& registry);

  [[nodiscard]] const KeyCommand& resolve(char key) const;

private:
  static constexpr size_t kTableSize{128};

  std::array<KeyCommand, kTableSize> table_{};
  KeyCommand none_{};
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_KEY_MAP_HPP
