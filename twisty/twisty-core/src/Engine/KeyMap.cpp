#include "twisty-core/src/Engine/KeyMap.hpp"

#include <cctype>

namespace twisty_core
{

KeyMap::KeyMap(const FaceRegistry& registry)
{
  for (const auto& face : registry.faces())
  {
    auto const lower = static_cast<unsigned char>(face.key);
    auto const upper = static_cast<unsigned char>(std::toupper(lower));
    table_[lower] = KeyCommand{
      .kind = KeyCommand::Kind::Face, .face = face.id, .direction = 1};
    table_[upper] = KeyCommand{
      .kind = KeyCommand::Kind::Face, .face = face.id, .direction = -1};
  }

  table_[static_cast<unsigned char>(kShuffleKey)] =
    KeyCommand{.kind = KeyCommand::Kind::Shuffle};

  for (char slot = kFirstPresetKey; slot <= kLastPresetKey; ++slot)
  {
    table_[static_cast<unsigned char>(slot)] =
      KeyCommand{.kind = KeyCommand::Kind::CameraPreset, .slot = slot};
  }
}

const KeyCommand& KeyMap::resolve(char key) const
{
  auto const index = static_cast<unsigned char>(key);
  if (index >= kTableSize)
  {
    return none_;
  }
  return table_[index];
}

}  // namespace twisty_core
