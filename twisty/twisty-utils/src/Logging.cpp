#include "twisty-utils/src/Logging.hpp"

#include <iostream>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace twisty_utils
{

std::shared_ptr<spdlog::logger> getOrCreateLogger(
  const std::string& name,
  spdlog::level::level_enum level)
{
  std::shared_ptr<spdlog::logger> logger = spdlog::get(name);
  if (!logger)
  {
    try
    {
      logger = spdlog::stdout_color_mt(name);
    }
    catch (const spdlog::spdlog_ex& e)
    {
      std::cerr << "Logger initialization failed: " << e.what() << std::endl;
      logger = makeNullLogger(name);
    }
  }
  logger->set_level(level);
  return logger;
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name)
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>(name, std::move(sink));
}

}  // namespace twisty_utils
