#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

#include "twisty-exe/src/PuzzleApp.hpp"
#include "twisty-utils/src/Logging.hpp"

// Usage: twisty-exe [--debug] [seed]
int main(int argc, char* argv[])
{
  twisty_core::EngineConfig config;
  std::string seedArg;
  for (int i = 1; i < argc; ++i)
  {
    if (std::string_view{argv[i]} == "--debug")
    {
      config.debug = true;
    }
    else
    {
      seedArg = argv[i];
    }
  }

  auto logger = twisty_utils::getOrCreateLogger(
    "twisty", config.debug ? spdlog::level::debug : spdlog::level::info);

  try
  {
    if (!seedArg.empty())
    {
      config.shuffle.seed = static_cast<uint32_t>(std::stoul(seedArg));
    }

    twisty_exe::PuzzleApp application{config, logger};
    return application.runApp();
  }
  catch (const std::exception& e)
  {
    logger->error("Fatal: {}", e.what());
    return EXIT_FAILURE;
  }
}
