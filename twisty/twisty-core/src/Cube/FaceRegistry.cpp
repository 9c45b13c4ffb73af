// Ticket: 0001_face_turn_engine

#include "twisty-core/src/Cube/FaceRegistry.hpp"

#include <bitset>
#include <cctype>
#include <format>
#include <stdexcept>

namespace twisty_core
{

namespace
{

FaceDefinition makeDefinition(FaceId id,
                              char key,
                              double heading,
                              double pitch,
                              double roll,
                              size_t quorum,
                              const std::string& pivotName)
{
  return FaceDefinition{.id = id,
                        .key = key,
                        .rotation = EulerAngles::fromDegrees(heading, pitch, roll),
                        .quorum = quorum,
                        .pivotName = pivotName,
                        .volumeName = pivotName + "_collider"};
}

char lower(char key)
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(key)));
}

}  // namespace

std::vector<FaceDefinition> defaultFaceTable()
{
  return {
    makeDefinition(FaceId::Top, 't', -90.0, 0.0, 0.0, 9, "TOP_SIDE"),
    makeDefinition(FaceId::Bottom, 'd', -90.0, 0.0, 0.0, 9, "BOTTOM_SIDE"),
    makeDefinition(FaceId::Left, 'l', 0.0, 90.0, 0.0, 9, "LEFT_SIDE"),
    makeDefinition(FaceId::Right, 'r', 0.0, -90.0, 0.0, 9, "RIGHT_SIDE"),
    makeDefinition(FaceId::Front, 'f', 0.0, 0.0, 90.0, 9, "FRONT_SIDE"),
    makeDefinition(FaceId::Back, 'b', 0.0, 0.0, -90.0, 9, "BACK_SIDE"),
    makeDefinition(
      FaceId::CenterVertical, 'v', -90.0, 0.0, 0.0, 8, "CENTER_VERTICAL_SIDE"),
    makeDefinition(
      FaceId::CenterHorizontal, 'h', 0.0, 90.0, 0.0, 8, "CENTER_HORIZONTAL_SIDE"),
    makeDefinition(
      FaceId::CenterDouble, 'c', 0.0, 0.0, 90.0, 8, "CENTER_DOUBLE_SIDE")};
}

FaceRegistry::FaceRegistry(const std::vector<FaceDefinition>& table,
                           const SceneGraph& scene)
{
  if (table.size() != kFaceCount)
  {
    throw std::invalid_argument(std::format(
      "FaceRegistry: expected {} faces, got {}", kFaceCount, table.size()));
  }

  std::bitset<kFaceCount> seenFaces;
  std::bitset<26> seenKeys;

  for (const auto& entry : table)
  {
    std::string_view const faceName = toString(entry.id);

    if (seenFaces.test(toIndex(entry.id)))
    {
      throw std::invalid_argument(
        std::format("FaceRegistry: face {} listed twice", faceName));
    }
    seenFaces.set(toIndex(entry.id));

    if (std::isalpha(static_cast<unsigned char>(entry.key)) == 0)
    {
      throw std::invalid_argument(
        std::format("FaceRegistry: face {} key must be a letter", faceName));
    }
    auto const keyIndex = static_cast<size_t>(lower(entry.key) - 'a');
    if (seenKeys.test(keyIndex))
    {
      throw std::invalid_argument(std::format(
        "FaceRegistry: key '{}' bound to more than one face", entry.key));
    }
    seenKeys.set(keyIndex);

    if (entry.quorum == 0)
    {
      throw std::invalid_argument(
        std::format("FaceRegistry: face {} has zero quorum", faceName));
    }

    auto const pivot = scene.find(entry.pivotName);
    if (!pivot)
    {
      throw std::invalid_argument(std::format(
        "FaceRegistry: face {} pivot '{}' not found", faceName, entry.pivotName));
    }
    auto const volume = scene.find(entry.volumeName);
    if (!volume || !scene.bounds(*volume))
    {
      throw std::invalid_argument(
        std::format("FaceRegistry: face {} collision volume '{}' missing",
                    faceName,
                    entry.volumeName));
    }

    faces_[toIndex(entry.id)] = Face{.id = entry.id,
                                    .key = lower(entry.key),
                                    .rotation = entry.rotation,
                                    .quorum = entry.quorum,
                                    .pivot = *pivot,
                                    .volume = *volume};
  }
}

std::optional<FaceId> FaceRegistry::faceForKey(char key) const
{
  char const k = lower(key);
  for (const auto& face : faces_)
  {
    if (face.key == k)
    {
      return face.id;
    }
  }
  return std::nullopt;
}

std::optional<FaceId> FaceRegistry::faceForVolume(NodeId volume) const
{
  for (const auto& face : faces_)
  {
    if (face.volume == volume)
    {
      return face.id;
    }
  }
  return std::nullopt;
}

std::vector<char> FaceRegistry::commandKeys() const
{
  std::vector<char> keys;
  keys.reserve(2 * kFaceCount);
  for (const auto& face : faces_)
  {
    keys.push_back(face.key);
    keys.push_back(
      static_cast<char>(std::toupper(static_cast<unsigned char>(face.key))));
  }
  return keys;
}

}  // namespace twisty_core
