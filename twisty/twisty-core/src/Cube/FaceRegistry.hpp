// Ticket: 0001_face_turn_engine

#ifndef TWISTY_CORE_FACE_REGISTRY_HPP
#define TWISTY_CORE_FACE_REGISTRY_HPP

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "twisty-core/src/Cube/FaceId.hpp"
#include "twisty-core/src/DataTypes/EulerAngles.hpp"
#include "twisty-core/src/Scene/SceneGraph.hpp"

namespace twisty_core
{

/**
 * @brief Configuration entry for one face, before binding to a scene
 */
struct FaceDefinition
{
  FaceId id;
  char key;                 // Command key, either case accepted
  EulerAngles rotation;     // Pivot rotation for direction +1
  size_t quorum;            // Cubies required before the face may turn
  std::string pivotName;    // Scene node used as the temporary group parent
  std::string volumeName;   // Scene node carrying the collision volume
};

/**
 * @brief Face table of the standard 3x3x3 puzzle
 *
 * Outer faces require 9 cubies; the three center slices require 8 because
 * the core position is empty.
 */
std::vector<FaceDefinition> defaultFaceTable();

/**
 * @brief A face bound to its scene nodes
 */
struct Face
{
  FaceId id;
  char key;
  EulerAngles rotation;
  size_t quorum;
  NodeId pivot;
  NodeId volume;
};

/**
 * @brief Immutable lookup of the nine faces by id, command key and volume
 *
 * Built once at start-up. Construction validates the whole table; any
 * malformed entry is fatal.
 *
 * Thread safety: Immutable after construction
 */
class FaceRegistry
{
public:
  /**
   * @brief Bind a face table to a scene
   * @param table One entry per FaceId
   * @param scene Scene containing the pivot and volume nodes
   * @throws std::invalid_argument if a face is missing or duplicated, a key
   *         is not a letter or is bound twice (case-insensitive), a quorum
   *         is zero, or a pivot/volume node is missing or has no bounds
   */
  FaceRegistry(const std::vector<FaceDefinition>& table, const SceneGraph& scene);

  [[nodiscard]] const Face& face(FaceId id) const
  {
    return faces_[toIndex(id)];
  }

  /**
   * @brief Face bound to a command key, ignoring case
   */
  [[nodiscard]] std::optional<FaceId> faceForKey(char key) const;

  /**
   * @brief Face owning a collision volume node
   */
  [[nodiscard]] std::optional<FaceId> faceForVolume(NodeId volume) const;

  /**
   * @brief Every valid command key in both cases, in face order
   *        (lowercase then uppercase per face)
   */
  [[nodiscard]] std::vector<char> commandKeys() const;

  [[nodiscard]] const std::array<Face, kFaceCount>& faces() const
  {
    return faces_;
  }

private:
  std::array<Face, kFaceCount> faces_{};
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_FACE_REGISTRY_HPP
