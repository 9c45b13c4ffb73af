// Ticket: 0001_face_turn_engine

#include "twisty-core/src/Engine/RotationExecutor.hpp"

#include <stdexcept>
#include <utility>

namespace twisty_core
{

RotationExecutor::RotationExecutor(SceneGraph& scene,
                                   const FaceRegistry& registry,
                                   Timeline& timeline,
                                   NodeId cubeRoot,
                                   const AnimationConfig& config,
                                   std::shared_ptr<spdlog::logger> logger)
  : scene_{scene},
    registry_{registry},
    timeline_{timeline},
    cubeRoot_{cubeRoot},
    config_{config},
    logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("RotationExecutor: logger cannot be null");
  }
}

void RotationExecutor::execute(FaceId face,
                               int direction,
                               const std::set<NodeId>& cubies,
                               CompletionCallback onComplete)
{
  if (state_ == State::Rotating)
  {
    throw std::logic_error("RotationExecutor: rotation already in progress");
  }
  if (direction != 1 && direction != -1)
  {
    throw std::invalid_argument("RotationExecutor: direction must be +1 or -1");
  }

  const Face& target = registry_.face(face);

  // Residual transform from the previous turn of this face
  scene_.clearTransform(target.pivot);

  group_.assign(cubies.begin(), cubies.end());
  for (NodeId const cubie : group_)
  {
    scene_.reparent(cubie, target.pivot, true);
  }

  state_ = State::Rotating;
  onComplete_ = std::move(onComplete);

  logger_->debug("Rotating {} ({:+d}) with {} cubies{}",
                 toString(face),
                 direction,
                 group_.size(),
                 animationEnabled_ ? "" : " [instant]");

  auto const turns = static_cast<double>(direction);
  if (!animationEnabled_ || config_.rotationDuration.count() == 0)
  {
    applyRotation(target, turns);
    finish();
    return;
  }

  timeline_.animate(
    config_.rotationDuration,
    [this, &target, turns](double progress)
    { applyRotation(target, turns * progress); },
    [this]() { finish(); });
}

void RotationExecutor::applyRotation(const Face& face, double turns)
{
  scene_.setTransform(face.pivot,
                      ReferenceFrame{Coordinate{}, face.rotation * turns});
}

void RotationExecutor::finish()
{
  for (NodeId const cubie : group_)
  {
    scene_.reparent(cubie, cubeRoot_, true);
  }
  group_.clear();

  state_ = State::Idle;
  ++rotationsExecuted_;

  auto onComplete = std::move(onComplete_);
  onComplete_ = nullptr;
  if (onComplete)
  {
    onComplete();
  }
}

}  // namespace twisty_core
