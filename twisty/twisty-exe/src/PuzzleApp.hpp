#ifndef TWISTY_EXE_PUZZLE_APP_HPP
#define TWISTY_EXE_PUZZLE_APP_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include <SDL3/SDL.h>
#include <spdlog/spdlog.h>

#include "twisty-core/src/Engine/PuzzleEngine.hpp"

namespace twisty_exe
{

class SDLException final : public std::runtime_error
{
public:
  explicit SDLException(const std::string& message)
    : std::runtime_error(message + ": " + SDL_GetError())
  {
  }
};

/**
 * @brief Window and event loop driving a PuzzleEngine
 *
 * Text input characters go to the engine unchanged; Escape or closing the
 * window quits. The window title carries the HUD text.
 */
class PuzzleApp
{
public:
  enum class Status : uint8_t
  {
    Starting,
    Running,
    Exiting
  };

  /**
   * @throws SDLException if SDL or the window cannot be initialised
   */
  PuzzleApp(const twisty_core::EngineConfig& config,
            std::shared_ptr<spdlog::logger> logger);

  PuzzleApp(const PuzzleApp&) = delete;
  PuzzleApp& operator=(const PuzzleApp&) = delete;
  PuzzleApp(PuzzleApp&&) = delete;
  PuzzleApp& operator=(PuzzleApp&&) = delete;
  ~PuzzleApp() = default;

  int runApp();

  Status getStatus() const
  {
    return status_;
  }

private:
  // Owns SDL_Init/SDL_Quit for the application's lifetime
  class SDLContext
  {
  public:
    explicit SDLContext(SDL_InitFlags flags)
    {
      if (!SDL_Init(flags))
      {
        throw SDLException("Failed to initialise SDL");
      }
    }

    SDLContext(const SDLContext&) = delete;
    SDLContext& operator=(const SDLContext&) = delete;
    SDLContext(SDLContext&&) = delete;
    SDLContext& operator=(SDLContext&&) = delete;

    ~SDLContext()
    {
      SDL_Quit();
    }
  };

  struct SDLWindowDeleter
  {
    void operator()(SDL_Window* w) const
    {
      SDL_DestroyWindow(w);
    }
  };

  void handleEvents();

  void refreshTitle();

  Status status_{Status::Starting};
  std::shared_ptr<spdlog::logger> logger_;
  SDLContext sdl_;
  std::unique_ptr<SDL_Window, SDLWindowDeleter> window_;
  std::unique_ptr<twisty_core::PuzzleEngine> engine_;
  std::string title_;
};

}  // namespace twisty_exe

#endif  // TWISTY_EXE_PUZZLE_APP_HPP
