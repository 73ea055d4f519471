#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace cutoutreel {

/**
 * @brief Returns the named file logger of a module, creating it on first use.
 *
 * The logger writes to `<log directory>/<file_name>`. When the sink cannot be
 * opened a null logger is returned instead, so logging never throws into
 * processing code.
 */
std::shared_ptr<spdlog::logger> moduleLogger(const std::string &name,
                                             const std::string &file_name);

// Directory used by loggers created after this call (default "logs")
void setLogDirectory(const std::string &directory);
[[nodiscard]] std::string logDirectory();

// Applies a level such as "debug" or "warn" to every registered logger
void setLogLevel(const std::string &level);

} // namespace cutoutreel
