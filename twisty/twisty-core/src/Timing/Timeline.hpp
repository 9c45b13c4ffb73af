// Ticket: 0004_move_scheduling

#ifndef TWISTY_CORE_TIMELINE_HPP
#define TWISTY_CORE_TIMELINE_HPP

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <map>

namespace twisty_core
{

/**
 * @brief Cooperative timer and animation driver on simulated time
 *
 * Nothing runs on its own: the owner advances the clock with update(), and
 * every delayed action and animation step runs inside that call on the
 * caller's thread. Due items run in order of due time, ties broken by the
 * order they were scheduled, with now() reporting their due time while they
 * run. Callbacks may schedule further work; work that becomes due within the
 * same update() runs in that same call.
 *
 * Thread safety: Not thread-safe
 */
class Timeline
{
public:
  using StepCallback = std::function<void(double progress)>;
  using Action = std::function<void()>;

  Timeline() = default;

  Timeline(const Timeline&) = delete;
  Timeline& operator=(const Timeline&) = delete;
  Timeline(Timeline&&) = delete;
  Timeline& operator=(Timeline&&) = delete;
  ~Timeline() = default;

  /**
   * @brief Run @p action once @p delay has elapsed
   */
  void after(std::chrono::milliseconds delay, Action action);

  /**
   * @brief Run an animation over @p duration
   *
   * @p onStep receives the progress in [0, 1] on every update while the
   * animation runs and exactly once with 1.0 when it ends, immediately
   * before @p onComplete.
   *
   * @throws std::invalid_argument if @p duration is negative
   */
  void animate(std::chrono::milliseconds duration,
               StepCallback onStep,
               Action onComplete);

  /**
   * @brief Advance the clock to @p absoluteTime and run everything due
   *
   * An earlier time than the current clock is ignored.
   */
  void update(std::chrono::milliseconds absoluteTime);

  [[nodiscard]] std::chrono::milliseconds now() const
  {
    return now_;
  }

  /**
   * @brief Number of delayed actions and animations still outstanding
   */
  [[nodiscard]] size_t pendingCount() const
  {
    return tasks_.size();
  }

  [[nodiscard]] bool isIdle() const
  {
    return tasks_.empty();
  }

private:
  struct TaskKey
  {
    std::chrono::milliseconds due;
    uint64_t sequence;

    auto operator<=>(const TaskKey&) const = default;
  };

  struct Task
  {
    std::chrono::milliseconds start;
    std::chrono::milliseconds duration;
    StepCallback onStep;  // Empty for plain delayed actions
    Action onComplete;
  };

  void schedule(std::chrono::milliseconds duration,
                StepCallback onStep,
                Action onComplete);

  std::map<TaskKey, Task> tasks_;
  std::chrono::milliseconds now_{0};
  uint64_t nextSequence_{0};
};

}  // namespace twisty_core

#endif  // TWISTY_CORE_TIMELINE_HPP
