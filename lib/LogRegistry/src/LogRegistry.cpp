#include "LogRegistry/LogRegistry.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
std::mutex registryMutex;
spdlog::level::level_enum currentLevel = spdlog::level::warn;
}

void LogRegistry::Init(bool verbose)
{
    std::lock_guard lock(registryMutex);
    currentLevel = (true == verbose) ? spdlog::level::debug : spdlog::level::warn;
    spdlog::set_level(currentLevel);
}

std::shared_ptr<spdlog::logger> LogRegistry::Get(const std::string& name)
{
    std::lock_guard lock(registryMutex);
    std::shared_ptr<spdlog::logger> logger = spdlog::get(name);
    if (nullptr != logger)
    {
        return logger;
    }

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_color_mode(spdlog::color_mode::automatic);
    sink->set_pattern(LogFormat);

    logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(currentLevel);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}
