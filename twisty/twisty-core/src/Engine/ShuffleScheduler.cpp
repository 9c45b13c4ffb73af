// Ticket: 0004_move_scheduling

#include "twisty-core/src/Engine/ShuffleScheduler.hpp"

#include <stdexcept>

namespace twisty_core
{

ShuffleScheduler::ShuffleScheduler(MoveDispatcher& dispatcher,
                                   RotationExecutor& executor,
                                   Timeline& timeline,
                                   const FaceRegistry& registry,
                                   const ShuffleConfig& config,
                                   std::shared_ptr<spdlog::logger> logger)
  : dispatcher_{dispatcher},
    executor_{executor},
    timeline_{timeline},
    keys_{registry.commandKeys()},
    config_{config},
    logger_{std::move(logger)},
    seed_{config.seed ? *config.seed : std::random_device{}()},
    rng_{seed_}
{
  if (!logger_)
  {
    throw std::invalid_argument("ShuffleScheduler: logger cannot be null");
  }
  if (config_.minMoves == 0 || config_.minMoves > config_.maxMoves)
  {
    throw std::invalid_argument("ShuffleScheduler: invalid move-count range");
  }
}

std::vector<char> ShuffleScheduler::generatePlan()
{
  std::uniform_int_distribution<size_t> lengthDist{config_.minMoves,
                                                   config_.maxMoves};
  std::uniform_int_distribution<size_t> keyDist{0, keys_.size() - 1};

  std::vector<char> plan(lengthDist(rng_));
  for (char& key : plan)
  {
    key = keys_[keyDist(rng_)];
  }
  return plan;
}

bool ShuffleScheduler::start()
{
  if (state_ == State::Running)
  {
    logger_->warn("Shuffle already running, request ignored");
    return false;
  }
  if (dispatcher_.state() != MoveDispatcher::MoveState::Idle)
  {
    logger_->warn("Move in flight, shuffle request ignored");
    return false;
  }

  plan_ = generatePlan();
  movesIssued_ = 0;
  state_ = State::Running;

  executor_.setAnimationEnabled(false);
  dispatcher_.acquireInput();

  logger_->info("Shuffle started: {} moves (seed {})", plan_.size(), seed_);
  timeline_.after(config_.leadIn, [this]() { playNext(); });
  return true;
}

void ShuffleScheduler::playNext()
{
  if (movesIssued_ == plan_.size())
  {
    finish();
    return;
  }

  char const key = plan_[movesIssued_++];
  auto const result =
    dispatcher_.attempt(key, MoveDispatcher::InputOwner::Shuffler);
  if (result != AttemptResult::RotationStarted)
  {
    logger_->warn("Shuffle move {} ('{}') not applied: {}",
                  movesIssued_,
                  key,
                  toString(result));
  }

  timeline_.after(config_.moveInterval, [this]() { playNext(); });
}

void ShuffleScheduler::finish()
{
  executor_.setAnimationEnabled(true);
  state_ = State::Idle;
  ++shufflesCompleted_;
  dispatcher_.releaseInput();

  logger_->info("Shuffle finished after {} moves", movesIssued_);

  if (finishedHandler_)
  {
    finishedHandler_();
  }
}

}  // namespace twisty_core
