// Ticket: 0001_face_turn_engine

#include "twisty-core/src/Engine/PuzzleEngine.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace twisty_core
{

namespace
{

const EngineConfig& validated(const EngineConfig& config)
{
  config.validate();
  return config;
}

std::shared_ptr<spdlog::logger> requireLogger(
  std::shared_ptr<spdlog::logger> logger)
{
  if (!logger)
  {
    throw std::invalid_argument("PuzzleEngine: logger cannot be null");
  }
  return logger;
}

}  // namespace

PuzzleEngine::PuzzleEngine(const EngineConfig& config,
                           std::shared_ptr<spdlog::logger> logger)
  : config_{validated(config)},
    logger_{requireLogger(std::move(logger))},
    scene_{},
    assembly_{scene_, config_.layout},
    registry_{defaultFaceTable(), scene_},
    keyMap_{registry_},
    collision_{scene_, config_.collision.colliderInset, logger_},
    aggregator_{registry_},
    executor_{scene_,
              registry_,
              timeline_,
              assembly_.cubeRoot(),
              config_.animation,
              logger_},
    dispatcher_{scene_,
                registry_,
                keyMap_,
                collision_,
                aggregator_,
                executor_,
                assembly_.cubies(),
                config_.collision,
                logger_},
    shuffler_{dispatcher_,
              executor_,
              timeline_,
              registry_,
              config_.shuffle,
              logger_}
{
  dispatcher_.setCameraHandler([this](char slot)
                               { return applyCameraPreset(slot); });
  dispatcher_.setShuffleHandler([this]() { return shuffler_.start(); });
  dispatcher_.setMoveCompletedHandler([this](const MoveRecord& record)
                                      { recordMove(record); });

  if (config_.debug)
  {
    logger_->debug("Scene hierarchy:\n{}", scene_.describe());
  }

  logger_->info("Puzzle ready: {} cubies, {} faces",
                assembly_.cubies().size(),
                registry_.faces().size());
}

AttemptResult PuzzleEngine::handleKey(char key)
{
  auto const result = dispatcher_.attempt(key);
  if (result != AttemptResult::Dropped &&
      std::isalpha(static_cast<unsigned char>(key)) != 0)
  {
    hud_.lastKey = std::string(1, key);
  }
  return result;
}

void PuzzleEngine::update(std::chrono::milliseconds absoluteTime)
{
  timeline_.update(absoluteTime);
}

bool PuzzleEngine::startShuffle()
{
  return shuffler_.start();
}

bool PuzzleEngine::isBusy() const
{
  return dispatcher_.state() != MoveDispatcher::MoveState::Idle ||
         shuffler_.state() == ShuffleScheduler::State::Running ||
         !timeline_.isIdle();
}

void PuzzleEngine::recordMove(const MoveRecord& record)
{
  history_.push_back(record);
  while (history_.size() > config_.historyLimit)
  {
    history_.pop_front();
  }
}

bool PuzzleEngine::applyCameraPreset(char slot)
{
  auto const preset = CameraPresetSelector::select(slot, cameraOrientation_);
  if (!preset)
  {
    return false;
  }
  cameraOrientation_ = preset->orientation;
  hud_.info = preset->label;
  logger_->debug("Camera preset '{}': {}", slot, preset->label);
  return true;
}

}  // namespace twisty_core
