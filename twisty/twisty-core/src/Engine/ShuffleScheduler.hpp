// Ticket: 0004_move_scheduling

#ifndef TWISTY_CORE_SHUFFLE_SCHEDULER_HPP
#define TWISTY_CORE_SHUFFLE_SCHEDULER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "twisty-core/src/Cube/FaceRegistry.hpp"
#include "twisty-core/src/Engine/EngineConfig.hpp"
#include "twisty-core/src/Engine/MoveDispatcher.hpp"
#include "twisty-core/src/Engine/RotationExecutor.hpp"
#include "twisty-core/src/Timing/Timeline.hpp"

namespace twisty_core
{

/**
 * @brief Plays a random sequence of moves through the dispatcher
 *
 * A shuffle disables animation, takes the input channel from the user, waits
 * the lead-in, then issues one move per interval. After the last interval it
 * re-enables animation and hands the input channel back. A running shuffle
 * cannot be cancelled; a second start() while one runs is refused.
 *
 * With a fixed seed the sequence of plans is reproducible.
 *
 * Thread safety: Not thread-safe
 */
class ShuffleScheduler
{
public:
  enum class State : uint8_t
  {
    Idle,
    Running
  };

  /**
   * @param dispatcher Move entry point (non-owning)
   * @param executor Rotation executor whose animation is suspended (non-owning)
   * @param timeline Timer driver (non-owning)
   * @param registry Source of the valid command keys (non-owning)
   * @param config Move-count range, pacing and seed
   * @param logger Logger for shuffle lifecycle
   * @throws std::invalid_argument if @p logger is null or the move range is
   *         empty
   */
  ShuffleScheduler(MoveDispatcher& dispatcher,
                   RotationExecutor& executor,
                   Timeline& timeline,
                   const FaceRegistry& registry,
                   const ShuffleConfig& config,
                   std::shared_ptr<spdlog::logger> logger);

  ShuffleScheduler(const ShuffleScheduler&) = delete;
  ShuffleScheduler& operator=(const ShuffleScheduler&) = delete;
  ShuffleScheduler(ShuffleScheduler&&) = delete;
  ShuffleScheduler& operator=(ShuffleScheduler&&) = delete;
  ~ShuffleScheduler() = default;

  /**
   * @brief Begin a shuffle
   * @return false if a shuffle is already running or a move is in flight
   */
  bool start();

  /**
   * @brief Draw a move sequence: a uniform length in [minMoves, maxMoves],
   *        each move a uniform choice among every command key in both cases
   */
  [[nodiscard]] std::vector<char> generatePlan();

  [[nodiscard]] State state() const
  {
    return state_;
  }

  /**
   * @brief Sequence of the running or most recent shuffle
   */
  [[nodiscard]] const std::vector<char>& currentPlan() const
  {
    return plan_;
  }

  /**
   * @brief Moves of the current plan issued so far
   */
  [[nodiscard]] size_t movesIssued() const
  {
    return movesIssued_;
  }

  [[nodiscard]] uint64_t shufflesCompleted() const
  {
    return shufflesCompleted_;
  }

  [[nodiscard]] uint32_t seed() const
  {
    return seed_;
  }

  void setFinishedHandler(std::function<void()> handler)
  {
    finishedHandler_ = std::move(handler);
  }

private:
  void playNext();

  void finish();

  MoveDispatcher& dispatcher_;
  RotationExecutor& executor_;
  Timeline& timeline_;
  std::vector<char> keys_;
  ShuffleConfig config_;
  std::shared_ptr<spdlog::logger> logger_;

  uint32_t seed_;
  std::mt19937 rng_;

  State state_{State::Idle};
  std::vector<char> plan_;
  size_t movesIssued_{0};
  uint64_t shufflesCompleted_{0};
  std::function<void()> finishedHandler_;
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_SHUFFLE_SCHEDULER_HPP
