// Ticket: 0001_face_turn_engine

#ifndef TWISTY_CORE_PUZZLE_ENGINE_HPP
#define TWISTY_CORE_PUZZLE_ENGINE_HPP

#include <chrono>
#include <deque>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "twisty-core/src/Collision/BoundsCollisionSystem.hpp"
#include "twisty-core/src/Cube/CubeAssembly.hpp"
#include "twisty-core/src/Cube/FaceRegistry.hpp"
#include "twisty-core/src/DataTypes/EulerAngles.hpp"
#include "twisty-core/src/Engine/CameraPresetSelector.hpp"
#include "twisty-core/src/Engine/CollisionAggregator.hpp"
#include "twisty-core/src/Engine/EngineConfig.hpp"
#include "twisty-core/src/Engine/KeyMap.hpp"
#include "twisty-core/src/Engine/MoveDispatcher.hpp"
#include "twisty-core/src/Engine/RotationExecutor.hpp"
#include "twisty-core/src/Engine/ShuffleScheduler.hpp"
#include "twisty-core/src/Scene/SceneGraph.hpp"
#include "twisty-core/src/Timing/Timeline.hpp"

namespace twisty_core
{

/**
 * @brief Text the front end shows on screen
 */
struct HudState
{
  std::string lastKey;  // Last accepted letter key
  std::string info;     // Label of the last camera preset
};

/**
 * @brief The puzzle: scene, face table, collision, and the move pipeline
 *
 * Owns every component and wires them together. The front end forwards key
 * characters to handleKey() and advances time with update(); everything else
 * happens inside those two calls.
 *
 * @code
 * PuzzleEngine engine{EngineConfig{}, logger};
 * engine.handleKey('t');
 * engine.update(std::chrono::milliseconds{300});  // animation done
 * @endcode
 *
 * Thread safety: Not thread-safe
 */
class PuzzleEngine
{
public:
  /**
   * @brief Build the cube and the move pipeline
   * @param config Start-up configuration
   * @param logger Logger shared by every component
   * @throws std::invalid_argument if @p config is invalid or @p logger is null
   */
  PuzzleEngine(const EngineConfig& config,
               std::shared_ptr<spdlog::logger> logger);

  PuzzleEngine(const PuzzleEngine&) = delete;
  PuzzleEngine& operator=(const PuzzleEngine&) = delete;
  PuzzleEngine(PuzzleEngine&&) = delete;
  PuzzleEngine& operator=(PuzzleEngine&&) = delete;
  ~PuzzleEngine() = default;

  /**
   * @brief Forward one input character to the move dispatcher
   */
  AttemptResult handleKey(char key);

  /**
   * @brief Advance simulated time to @p absoluteTime
   */
  void update(std::chrono::milliseconds absoluteTime);

  /**
   * @brief Start a shuffle directly, as the space key does
   * @return false if refused
   */
  bool startShuffle();

  /**
   * @brief True while a rotation, a shuffle or any timed work is pending
   */
  [[nodiscard]] bool isBusy() const;

  [[nodiscard]] const SceneGraph& scene() const
  {
    return scene_;
  }

  [[nodiscard]] const CubeAssembly& assembly() const
  {
    return assembly_;
  }

  [[nodiscard]] const FaceRegistry& registry() const
  {
    return registry_;
  }

  [[nodiscard]] const CollisionAggregator& aggregator() const
  {
    return aggregator_;
  }

  [[nodiscard]] const MoveDispatcher& dispatcher() const
  {
    return dispatcher_;
  }

  [[nodiscard]] const RotationExecutor& executor() const
  {
    return executor_;
  }

  [[nodiscard]] const ShuffleScheduler& shuffler() const
  {
    return shuffler_;
  }

  [[nodiscard]] const Timeline& timeline() const
  {
    return timeline_;
  }

  [[nodiscard]] const EulerAngles& cameraOrientation() const
  {
    return cameraOrientation_;
  }

  [[nodiscard]] const HudState& hud() const
  {
    return hud_;
  }

  /**
   * @brief Completed moves, user and shuffle alike, oldest first
   *
   * Holds at most EngineConfig::historyLimit records; older ones are
   * discarded as new moves complete.
   */
  [[nodiscard]] const std::deque<MoveRecord>& moveHistory() const
  {
    return history_;
  }

  void clearMoveHistory()
  {
    history_.clear();
  }

private:
  bool applyCameraPreset(char slot);
  void recordMove(const MoveRecord& record);

  EngineConfig config_;
  std::shared_ptr<spdlog::logger> logger_;

  SceneGraph scene_;
  CubeAssembly assembly_;
  FaceRegistry registry_;
  KeyMap keyMap_;
  BoundsCollisionSystem collision_;
  CollisionAggregator aggregator_;
  Timeline timeline_;
  RotationExecutor executor_;
  MoveDispatcher dispatcher_;
  ShuffleScheduler shuffler_;

  EulerAngles cameraOrientation_{};
  HudState hud_;
  std::deque<MoveRecord> history_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_PUZZLE_ENGINE_HPP
