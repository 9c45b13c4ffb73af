// Ticket: 0001_face_turn_engine
// Ticket: 0003_face_membership

#ifndef TWISTY_CORE_MOVE_DISPATCHER_HPP
#define TWISTY_CORE_MOVE_DISPATCHER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "twisty-core/src/Collision/CollisionSystem.hpp"
#include "twisty-core/src/Cube/FaceRegistry.hpp"
#include "twisty-core/src/Engine/CollisionAggregator.hpp"
#include "twisty-core/src/Engine/EngineConfig.hpp"
#include "twisty-core/src/Engine/KeyMap.hpp"
#include "twisty-core/src/Engine/RotationExecutor.hpp"
#include "twisty-core/src/Scene/SceneGraph.hpp"

namespace twisty_core
{

/**
 * @brief A completed quarter turn
 */
struct MoveRecord
{
  FaceId face;
  int direction;
  char key;
};

/**
 * @brief Outcome of a single key attempt
 */
enum class AttemptResult : uint8_t
{
  RotationStarted,   // Quorum reached; the rotation may already be complete
  NoQuorum,          // Face selected but too few cubies detected
  CameraChanged,     // Camera preset applied
  ShuffleRequested,  // Shuffle started
  Ignored,           // Key bound to nothing, or the request was refused
  Dropped            // Move in flight or input held by the shuffler
};

std::string_view toString(AttemptResult result);

/**
 * @brief Single entry point for key input, and the gate that keeps at most
 *        one move in flight
 *
 * For a face key the dispatcher refreshes the face's membership through the
 * collision system, feeds the detected cubies into the aggregator and, once
 * quorum is reached, hands the layer to the rotation executor. While a
 * rotation runs every attempt is dropped. While the shuffler holds the input
 * channel only its own attempts are honoured.
 *
 * State machine: Idle -> Collecting -> Rotating -> Idle. Collecting falls
 * back to Idle when quorum is not reached.
 *
 * Thread safety: Not thread-safe
 */
class MoveDispatcher
{
public:
  enum class MoveState : uint8_t
  {
    Idle,
    Collecting,
    Rotating
  };

  enum class InputOwner : uint8_t
  {
    User,
    Shuffler
  };

  using CameraHandler = std::function<bool(char slot)>;
  using ShuffleHandler = std::function<bool()>;
  using MoveCompletedHandler = std::function<void(const MoveRecord&)>;

  /**
   * @param scene Scene holding the cubies (non-owning)
   * @param registry Face table (non-owning)
   * @param keyMap Key lookup (non-owning)
   * @param collision Spatial collision subsystem (non-owning); its report
   *        hook is claimed by this dispatcher
   * @param aggregator Per-face membership sets (non-owning)
   * @param executor Rotation executor (non-owning)
   * @param cubies Full cubie population
   * @param config Membership refresh settings
   * @param logger Logger for accepted and dropped input
   * @throws std::invalid_argument if @p logger is null or @p cubies is empty
   */
  MoveDispatcher(SceneGraph& scene,
                 const FaceRegistry& registry,
                 const KeyMap& keyMap,
                 CollisionSystem& collision,
                 CollisionAggregator& aggregator,
                 RotationExecutor& executor,
                 std::vector<NodeId> cubies,
                 const CollisionConfig& config,
                 std::shared_ptr<spdlog::logger> logger);

  MoveDispatcher(const MoveDispatcher&) = delete;
  MoveDispatcher& operator=(const MoveDispatcher&) = delete;
  MoveDispatcher(MoveDispatcher&&) = delete;
  MoveDispatcher& operator=(MoveDispatcher&&) = delete;
  ~MoveDispatcher();

  /**
   * @brief Handle one key
   * @param key Input character
   * @param caller Who is asking; user attempts are dropped while the
   *        shuffler holds the input channel
   * @return What happened; never throws for bad input
   */
  AttemptResult attempt(char key, InputOwner caller = InputOwner::User);

  /**
   * @brief Give the input channel to the shuffler
   * @throws std::logic_error if the shuffler already holds it
   */
  void acquireInput();

  /**
   * @brief Return the input channel to the user
   */
  void releaseInput();

  void setCameraHandler(CameraHandler handler)
  {
    cameraHandler_ = std::move(handler);
  }

  void setShuffleHandler(ShuffleHandler handler)
  {
    shuffleHandler_ = std::move(handler);
  }

  void setMoveCompletedHandler(MoveCompletedHandler handler)
  {
    moveCompletedHandler_ = std::move(handler);
  }

  [[nodiscard]] MoveState state() const
  {
    return state_;
  }

  [[nodiscard]] InputOwner inputOwner() const
  {
    return inputOwner_;
  }

  /**
   * @brief Number of attempts dropped by the gate
   */
  [[nodiscard]] uint64_t droppedCount() const
  {
    return droppedCount_;
  }

  [[nodiscard]] const std::vector<NodeId>& cubies() const
  {
    return cubies_;
  }

private:
  AttemptResult attemptFace(const KeyCommand& command, char key);

  /// @brief Bring the face's collision set up to date with the scene
  void refreshMembership(const Face& face);

  void translateAll(double offset);

  void onReport(NodeId volume, NodeId cubie);

  void onRotationComplete(const MoveRecord& record);

  SceneGraph& scene_;
  const FaceRegistry& registry_;
  const KeyMap& keyMap_;
  CollisionSystem& collision_;
  CollisionAggregator& aggregator_;
  RotationExecutor& executor_;
  std::vector<NodeId> cubies_;
  CollisionConfig config_;
  std::shared_ptr<spdlog::logger> logger_;

  MoveState state_{MoveState::Idle};
  InputOwner inputOwner_{InputOwner::User};
  bool capturing_{false};  // Reports reach the aggregator only while set
  uint64_t droppedCount_{0};

  CameraHandler cameraHandler_;
  ShuffleHandler shuffleHandler_;
  MoveCompletedHandler moveCompletedHandler_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_MOVE_DISPATCHER_HPP
