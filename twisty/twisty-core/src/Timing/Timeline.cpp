// Ticket: 0004_move_scheduling

#include "twisty-core/src/Timing/Timeline.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace twisty_core
{

void Timeline::after(std::chrono::milliseconds delay, Action action)
{
  schedule(std::max(delay, std::chrono::milliseconds{0}),
           StepCallback{},
           std::move(action));
}

void Timeline::animate(std::chrono::milliseconds duration,
                       StepCallback onStep,
                       Action onComplete)
{
  if (duration.count() < 0)
  {
    throw std::invalid_argument("Timeline: animation duration is negative");
  }
  schedule(duration, std::move(onStep), std::move(onComplete));
}

void Timeline::schedule(std::chrono::milliseconds duration,
                        StepCallback onStep,
                        Action onComplete)
{
  tasks_.emplace(TaskKey{.due = now_ + duration, .sequence = nextSequence_++},
                 Task{.start = now_,
                      .duration = duration,
                      .onStep = std::move(onStep),
                      .onComplete = std::move(onComplete)});
}

void Timeline::update(std::chrono::milliseconds absoluteTime)
{
  if (absoluteTime < now_)
  {
    return;
  }

  // Finish everything due, one at a time so callbacks see a consistent clock
  // and may schedule more work
  while (!tasks_.empty() && tasks_.begin()->first.due <= absoluteTime)
  {
    auto node = tasks_.extract(tasks_.begin());
    now_ = node.key().due;
    Task& task = node.mapped();
    if (task.onStep)
    {
      task.onStep(1.0);
    }
    if (task.onComplete)
    {
      task.onComplete();
    }
  }

  now_ = absoluteTime;

  // Step animations still running. Collect first; a step callback must not
  // invalidate the iteration.
  std::vector<std::pair<StepCallback, double>> steps;
  for (const auto& [key, task] : tasks_)
  {
    if (task.onStep && task.duration.count() > 0)
    {
      double const elapsed =
        static_cast<double>((now_ - task.start).count());
      double const progress =
        std::min(1.0, elapsed / static_cast<double>(task.duration.count()));
      steps.emplace_back(task.onStep, progress);
    }
  }
  for (auto& [onStep, progress] : steps)
  {
    onStep(progress);
  }
}

}  // namespace twisty_core
