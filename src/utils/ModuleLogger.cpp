#include "ModuleLogger.hpp"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace cutoutreel {

namespace {
std::mutex registryMutex;
std::string currentLogDirectory = "logs";
spdlog::level::level_enum currentLevel = spdlog::level::info;
} // namespace

std::shared_ptr<spdlog::logger> moduleLogger(const std::string &name,
                                             const std::string &file_name) {
  std::lock_guard lock(registryMutex);

  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  try {
    std::filesystem::create_directories(currentLogDirectory);
    auto logger = spdlog::basic_logger_mt(
        name, (std::filesystem::path(currentLogDirectory) / file_name)
                  .string());
    logger->set_level(currentLevel);
    logger->flush_on(spdlog::level::warn);
    return logger;
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
  } catch (const std::filesystem::filesystem_error &ex) {
    std::cerr << "Cannot create log directory: " << ex.what() << std::endl;
  }
  return spdlog::null_logger_mt(name);
}

void setLogDirectory(const std::string &directory) {
  std::lock_guard lock(registryMutex);
  currentLogDirectory = directory.empty() ? "logs" : directory;
}

std::string logDirectory() {
  std::lock_guard lock(registryMutex);
  return currentLogDirectory;
}

void setLogLevel(const std::string &level) {
  std::lock_guard lock(registryMutex);
  currentLevel = spdlog::level::from_str(level);
  spdlog::set_level(currentLevel);
}

} // namespace cutoutreel
