#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief Owner of the spdlog loggers used by the renaming tools.
 *
 * Loggers write to stderr so that reports on stdout stay clean.
 */
class LogRegistry
{
  public:
    /**
     * @brief Create the loggers. Later calls only adjust the level.
     *
     * @param[in] verbose Log at debug level instead of warn
     */
    static void Init(bool verbose);

    /**
     * @brief Get a logger by name, creating it on first use.
     *
     * @param[in] name Logger name
     * @return Registered logger
     */
    static std::shared_ptr<spdlog::logger> Get(const std::string& name);

    /** Logger for scanning and renaming. */
    static std::shared_ptr<spdlog::logger> Rename() { return Get("rename"); }

  private:
    static constexpr const char* LogFormat = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
};
