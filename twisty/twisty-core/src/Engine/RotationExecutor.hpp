// Ticket: 0001_face_turn_engine

#ifndef TWISTY_CORE_ROTATION_EXECUTOR_HPP
#define TWISTY_CORE_ROTATION_EXECUTOR_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <vector>

#include <spdlog/spdlog.h>

#include "twisty-core/src/Cube/FaceRegistry.hpp"
#include "twisty-core/src/Engine/EngineConfig.hpp"
#include "twisty-core/src/Scene/SceneGraph.hpp"
#include "twisty-core/src/Timing/Timeline.hpp"

namespace twisty_core
{

/**
 * @brief Turns a group of cubies a quarter turn about a face pivot
 *
 * A rotation runs in three steps:
 * 1. The pivot's transform is reset and every collided cubie is re-parented
 *    under it, keeping its world transform.
 * 2. The pivot is rotated by the face's Euler delta times the direction,
 *    either animated on the timeline or applied at once.
 * 3. Every cubie is re-parented back under the cube root, again keeping its
 *    world transform, and the completion callback runs.
 *
 * Only one rotation may be in progress at a time.
 *
 * Thread safety: Not thread-safe
 */
class RotationExecutor
{
public:
  enum class State : uint8_t
  {
    Idle,
    Rotating
  };

  using CompletionCallback = std::function<void()>;

  /**
   * @param scene Scene holding the cubies and pivots (non-owning)
   * @param registry Face table (non-owning)
   * @param timeline Animation driver (non-owning)
   * @param cubeRoot Node cubies return to after a rotation
   * @param config Animation settings
   * @param logger Logger for rotation events
   * @throws std::invalid_argument if @p logger is null
   */
  RotationExecutor(SceneGraph& scene,
                   const FaceRegistry& registry,
                   Timeline& timeline,
                   NodeId cubeRoot,
                   const AnimationConfig& config,
                   std::shared_ptr<spdlog::logger> logger);

  RotationExecutor(const RotationExecutor&) = delete;
  RotationExecutor& operator=(const RotationExecutor&) = delete;
  RotationExecutor(RotationExecutor&&) = delete;
  RotationExecutor& operator=(RotationExecutor&&) = delete;
  ~RotationExecutor() = default;

  /**
   * @brief Rotate @p cubies about the pivot of @p face
   *
   * When animation is disabled the whole rotation, including
   * @p onComplete, finishes before this call returns.
   *
   * @param face Face to turn
   * @param direction +1 or -1
   * @param cubies Cubies forming the layer
   * @param onComplete Invoked after the cubies are back under the cube root
   * @throws std::logic_error if a rotation is already in progress
   * @throws std::invalid_argument if @p direction is not +1 or -1
   */
  void execute(FaceId face,
               int direction,
               const std::set<NodeId>& cubies,
               CompletionCallback onComplete);

  void setAnimationEnabled(bool enabled)
  {
    animationEnabled_ = enabled;
  }

  [[nodiscard]] bool animationEnabled() const
  {
    return animationEnabled_;
  }

  [[nodiscard]] State state() const
  {
    return state_;
  }

  /**
   * @brief Number of rotations completed since construction
   */
  [[nodiscard]] uint64_t rotationsExecuted() const
  {
    return rotationsExecuted_;
  }

private:
  void applyRotation(const Face& face, double turns);

  void finish();

  SceneGraph& scene_;
  const FaceRegistry& registry_;
  Timeline& timeline_;
  NodeId cubeRoot_;
  AnimationConfig config_;
  std::shared_ptr<spdlog::logger> logger_;

  State state_{State::Idle};
  bool animationEnabled_{true};
  uint64_t rotationsExecuted_{0};

  // Rotation in progress
  std::vector<NodeId> group_;
  CompletionCallback onComplete_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_ROTATION_EXECUTOR_HPP
