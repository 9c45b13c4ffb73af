#include "twisty-exe/src/PuzzleApp.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <utility>

namespace twisty_exe
{

PuzzleApp::PuzzleApp(const twisty_core::EngineConfig& config,
                     std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}, sdl_{SDL_INIT_VIDEO}
{
  window_.reset(
    SDL_CreateWindow("Twisty", 800, 600, SDL_WINDOW_RESIZABLE));
  if (!window_)
  {
    throw SDLException("Failed to create SDL window");
  }

  engine_ = std::make_unique<twisty_core::PuzzleEngine>(config, logger_);

  if (!SDL_StartTextInput(window_.get()))
  {
    throw SDLException("Failed to enable text input");
  }

  status_ = Status::Running;
}

int PuzzleApp::runApp()
{
  SDL_ShowWindow(window_.get());
  refreshTitle();

  while (status_ == Status::Running)
  {
    handleEvents();
    engine_->update(std::chrono::milliseconds{SDL_GetTicks()});
    refreshTitle();
    SDL_Delay(16);
  }

  return EXIT_SUCCESS;
}

void PuzzleApp::handleEvents()
{
  SDL_Event event;
  while (SDL_PollEvent(&event))
  {
    switch (event.type)
    {
      case SDL_EVENT_QUIT:
        status_ = Status::Exiting;
        break;
      case SDL_EVENT_KEY_DOWN:
        if (event.key.key == SDLK_ESCAPE)
        {
          status_ = Status::Exiting;
        }
        break;
      case SDL_EVENT_TEXT_INPUT:
        for (const char* c = event.text.text; *c != '\0'; ++c)
        {
          auto const result = engine_->handleKey(*c);
          logger_->debug("Key '{}': {}", *c, twisty_core::toString(result));
        }
        break;
      default:
        break;
    }
  }
}

void PuzzleApp::refreshTitle()
{
  const auto& hud = engine_->hud();
  auto title = std::format("Twisty  [{}]  {}", hud.lastKey, hud.info);
  if (title != title_)
  {
    title_ = std::move(title);
    SDL_SetWindowTitle(window_.get(), title_.c_str());
  }
}

}  // namespace twisty_exe
