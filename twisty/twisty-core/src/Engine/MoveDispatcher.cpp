// Ticket: 0001_face_turn_engine
// Ticket: 0003_face_membership

#include "twisty-core/src/Engine/MoveDispatcher.hpp"

#include <stdexcept>

namespace twisty_core
{

std::string_view toString(AttemptResult result)
{
  switch (result)
  {
    case AttemptResult::RotationStarted:
      return "RotationStarted";
    case AttemptResult::NoQuorum:
      return "NoQuorum";
    case AttemptResult::CameraChanged:
      return "CameraChanged";
    case AttemptResult::ShuffleRequested:
      return "ShuffleRequested";
    case AttemptResult::Ignored:
      return "Ignored";
    case AttemptResult::Dropped:
      return "Dropped";
  }
  return "Unknown";
}

MoveDispatcher::MoveDispatcher(SceneGraph& scene,
                               const FaceRegistry& registry,
                               const KeyMap& keyMap,
                               CollisionSystem& collision,
                               CollisionAggregator& aggregator,
                               RotationExecutor& executor,
                               std::vector<NodeId> cubies,
                               const CollisionConfig& config,
                               std::shared_ptr<spdlog::logger> logger)
  : scene_{scene},
    registry_{registry},
    keyMap_{keyMap},
    collision_{collision},
    aggregator_{aggregator},
    executor_{executor},
    cubies_{std::move(cubies)},
    config_{config},
    logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("MoveDispatcher: logger cannot be null");
  }
  if (cubies_.empty())
  {
    throw std::invalid_argument("MoveDispatcher: cubie population is empty");
  }

  collision_.setReportHook([this](NodeId volume, NodeId cubie)
                           { onReport(volume, cubie); });
}

MoveDispatcher::~MoveDispatcher()
{
  collision_.setReportHook(nullptr);
}

AttemptResult MoveDispatcher::attempt(char key, InputOwner caller)
{
  if (state_ != MoveState::Idle ||
      (inputOwner_ == InputOwner::Shuffler && caller != InputOwner::Shuffler))
  {
    ++droppedCount_;
    logger_->debug("Dropped key '{}'", key);
    return AttemptResult::Dropped;
  }

  const KeyCommand& command = keyMap_.resolve(key);
  switch (command.kind)
  {
    case KeyCommand::Kind::Face:
      return attemptFace(command, key);

    case KeyCommand::Kind::CameraPreset:
      if (cameraHandler_ && cameraHandler_(command.slot))
      {
        return AttemptResult::CameraChanged;
      }
      return AttemptResult::Ignored;

    case KeyCommand::Kind::Shuffle:
      if (caller == InputOwner::User && shuffleHandler_ && shuffleHandler_())
      {
        return AttemptResult::ShuffleRequested;
      }
      return AttemptResult::Ignored;

    case KeyCommand::Kind::None:
      break;
  }

  logger_->debug("Ignored key '{}'", key);
  return AttemptResult::Ignored;
}

AttemptResult MoveDispatcher::attemptFace(const KeyCommand& command, char key)
{
  const Face& face = registry_.face(command.face);

  state_ = MoveState::Collecting;
  refreshMembership(face);

  auto const ready = aggregator_.firstQuorum();
  if (!ready)
  {
    state_ = MoveState::Idle;
    logger_->debug("Key '{}': {} has {} of {} cubies",
                   key,
                   toString(face.id),
                   aggregator_.size(face.id),
                   face.quorum);
    return AttemptResult::NoQuorum;
  }

  MoveRecord const record{
    .face = *ready, .direction = command.direction, .key = key};

  state_ = MoveState::Rotating;
  logger_->debug("Key '{}': turning {}", key, toString(record.face));
  executor_.execute(record.face,
                    record.direction,
                    aggregator_.members(record.face),
                    [this, record]() { onRotationComplete(record); });
  return AttemptResult::RotationStarted;
}

void MoveDispatcher::refreshMembership(const Face& face)
{
  if (config_.refresh == MembershipRefresh::Perturb)
  {
    // Moving every cubie directly forces the collision system to recompute
    // their bounds; the first traversal only warms it up.
    translateAll(config_.perturbationOffset);
    collision_.traverse(face.volume, cubies_);
    translateAll(-config_.perturbationOffset);
  }
  else
  {
    collision_.invalidate();
  }

  capturing_ = true;
  collision_.traverse(face.volume, cubies_);
  capturing_ = false;
}

void MoveDispatcher::translateAll(double offset)
{
  Coordinate const delta{offset, offset, offset};
  for (NodeId const cubie : cubies_)
  {
    scene_.translate(cubie, delta);
  }
}

void MoveDispatcher::onReport(NodeId volume, NodeId cubie)
{
  if (!capturing_)
  {
    return;
  }
  if (auto const face = registry_.faceForVolume(volume))
  {
    aggregator_.report(*face, cubie);
  }
}

void MoveDispatcher::onRotationComplete(const MoveRecord& record)
{
  aggregator_.clear(record.face);
  state_ = MoveState::Idle;

  if (moveCompletedHandler_)
  {
    moveCompletedHandler_(record);
  }
}

void MoveDispatcher::acquireInput()
{
  if (inputOwner_ == InputOwner::Shuffler)
  {
    throw std::logic_error("MoveDispatcher: shuffler already holds input");
  }
  inputOwner_ = InputOwner::Shuffler;
}

void MoveDispatcher::releaseInput()
{
  inputOwner_ = InputOwner::User;
}

}  // namespace twisty_core
