#ifndef TWISTY_CORE_ENGINE_CONFIG_HPP
#define TWISTY_CORE_ENGINE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "twisty-core/src/Cube/CubeAssembly.hpp"

namespace twisty_core
{

struct AnimationConfig
{
  std::chrono::milliseconds rotationDuration{280};
};

struct ShuffleConfig
{
  size_t minMoves{30};
  size_t maxMoves{60};
  std::chrono::milliseconds leadIn{1000};        // Pause before the first move
  std::chrono::milliseconds moveInterval{150};   // Pause after every move
  std::optional<uint32_t> seed;                  // Unseeded draws from random_device
};

/**
 * @brief How face membership is brought up to date before a traversal
 */
enum class MembershipRefresh : uint8_t
{
  Invalidate,  // Drop the collision cache, then traverse once
  Perturb      // Translate every cubie away and back, traversing each time
};

struct CollisionConfig
{
  MembershipRefresh refresh{MembershipRefresh::Invalidate};
  double perturbationOffset{15.0};  // Applied along x, y and z
  double colliderInset{0.2};        // Shrinks each cubie's tight bounds
};

/**
 * @brief Start-up configuration of a PuzzleEngine
 */
struct EngineConfig
{
  AnimationConfig animation;
  ShuffleConfig shuffle;
  CollisionConfig collision;
  CubeLayout layout;
  size_t historyLimit{256};  // Oldest moves beyond this are discarded
  bool debug{false};

  /**
   * @brief Check every field for a usable value
   * @throws std::invalid_argument on an empty or inverted move-count range,
   *         a negative duration, a zero perturbation offset, an inset that
   *         would invert a cubie collider or does not exceed the face
   *         volume overlap, or a non-positive layout
   */
  void validate() const;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_ENGINE_CONFIG_HPP
