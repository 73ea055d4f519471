#include "ReelConfig.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &configLogger() {
  static auto logger = moduleLogger("ConfigLogger", "config.log");
  return logger;
}

constexpr std::array<const char *, 7> LOG_LEVELS = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

const json &section(const json &root, const char *name) {
  static const json empty = json::object();
  const auto it = root.find(name);
  if (it == root.end()) {
    return empty;
  }
  if (!it->is_object()) {
    throw ConfigError(fmt::format("'{}' must be an object", name));
  }
  return *it;
}

template <typename T>
void readField(const json &obj, const std::string &where, const char *key,
               T &target) {
  const auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  try {
    target = it->get<T>();
  } catch (const json::exception &e) {
    throw ConfigError(fmt::format("{}.{}: {}", where, key, e.what()));
  }
}

void readPath(const json &obj, const std::string &where, const char *key,
              fs::path &target) {
  std::string value = target.string();
  readField(obj, where, key, value);
  target = value;
}

CutoutRequest parseCutout(const json &entry, std::size_t index) {
  const std::string where = fmt::format("cutouts[{}]", index);
  if (!entry.is_object()) {
    throw ConfigError(where + " must be an object");
  }
  if (!entry.contains("path")) {
    throw ConfigError(where + " has no 'path'");
  }

  CutoutRequest request;
  readPath(entry, where, "path", request.path);
  request.id = request.path.stem().string();
  readField(entry, where, "id", request.id);
  readField(entry, where, "size", request.size);
  readField(entry, where, "title", request.title);

  const bool hasX = entry.contains("x");
  const bool hasY = entry.contains("y");
  if (hasX != hasY) {
    throw ConfigError(where + " needs both 'x' and 'y' or neither");
  }
  if (hasX) {
    cv::Point center;
    readField(entry, where, "x", center.x);
    readField(entry, where, "y", center.y);
    request.center = center;
  }
  return request;
}

} // namespace

void validateConfig(const ReelConfig &config) {
  if (!(config.stats.sigma > 0.0)) {
    throw ConfigError(
        fmt::format("stats.sigma must be positive, got {}", config.stats.sigma));
  }
  if (config.stats.maxIterations < 0) {
    throw ConfigError(fmt::format("stats.max_iterations must be >= 0, got {}",
                                  config.stats.maxIterations));
  }
  if (!config.normalize.isValid()) {
    throw ConfigError(fmt::format(
        "normalize percentiles must satisfy 0 <= lower <= upper <= 100, "
        "got {} and {}",
        config.normalize.lowerPercentile, config.normalize.upperPercentile));
  }
  if (!isKnownColormap(config.render.colormap)) {
    throw ConfigError(
        fmt::format("render.colormap '{}' is unknown", config.render.colormap));
  }
  if (config.render.scale < 1) {
    throw ConfigError(
        fmt::format("render.scale must be >= 1, got {}", config.render.scale));
  }
  if (config.render.nanValue < 0 || config.render.nanValue > 255) {
    throw ConfigError(fmt::format("render.nan_value must be in [0, 255], got {}",
                                  config.render.nanValue));
  }
  if (config.animation.frameDurationMs <= 0) {
    throw ConfigError(
        fmt::format("animation.frame_duration_ms must be positive, got {}",
                    config.animation.frameDurationMs));
  }
  if (config.animation.output.empty()) {
    throw ConfigError("animation.output must not be empty");
  }
  if (config.animation.gridColumns < 1) {
    throw ConfigError(fmt::format("animation.grid_columns must be >= 1, got {}",
                                  config.animation.gridColumns));
  }
  if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), config.logging.level) ==
      LOG_LEVELS.end()) {
    throw ConfigError(
        fmt::format("logging.level '{}' is unknown", config.logging.level));
  }
  for (std::size_t i = 0; i < config.cutouts.size(); ++i) {
    if (config.cutouts[i].size < 0) {
      throw ConfigError(fmt::format("cutouts[{}].size must be >= 0, got {}", i,
                                    config.cutouts[i].size));
    }
  }
}

ReelConfig parseConfig(const json &j) {
  if (!j.is_object()) {
    throw ConfigError("Configuration root must be a JSON object");
  }

  ReelConfig config;

  const json &stats = section(j, "stats");
  readField(stats, "stats", "sigma", config.stats.sigma);
  readField(stats, "stats", "max_iterations", config.stats.maxIterations);

  const json &normalize = section(j, "normalize");
  readField(normalize, "normalize", "match_background",
            config.normalize.matchBackground);
  readField(normalize, "normalize", "match_noise", config.normalize.matchNoise);
  readField(normalize, "normalize", "shared_range", config.sharedRange);
  readField(normalize, "normalize", "lower_percentile",
            config.normalize.lowerPercentile);
  readField(normalize, "normalize", "upper_percentile",
            config.normalize.upperPercentile);
  config.normalize.clip = config.stats;

  const json &render = section(j, "render");
  readField(render, "render", "colormap", config.render.colormap);
  readField(render, "render", "flip_vertical", config.render.flipVertical);
  readField(render, "render", "scale", config.render.scale);
  readField(render, "render", "nan_value", config.render.nanValue);
  readField(render, "render", "draw_titles", config.render.drawTitle);

  const json &animation = section(j, "animation");
  readField(animation, "animation", "frame_duration_ms",
            config.animation.frameDurationMs);
  readPath(animation, "animation", "output", config.animation.output);
  readPath(animation, "animation", "frames_dir", config.animation.framesDir);
  readPath(animation, "animation", "grid_output", config.animation.gridOutput);
  readField(animation, "animation", "grid_columns",
            config.animation.gridColumns);

  const json &logging = section(j, "logging");
  readField(logging, "logging", "level", config.logging.level);
  readField(logging, "logging", "directory", config.logging.directory);

  if (const auto it = j.find("cutouts"); it != j.end()) {
    if (!it->is_array()) {
      throw ConfigError("'cutouts' must be an array");
    }
    for (std::size_t i = 0; i < it->size(); ++i) {
      config.cutouts.push_back(parseCutout((*it)[i], i));
    }
  }

  validateConfig(config);
  return config;
}

ReelConfig loadConfig(const fs::path &path) {
  std::ifstream file(path);
  if (!file) {
    configLogger()->error("Cannot open configuration file {}", path.string());
    throw ConfigError("Cannot open configuration file " + path.string());
  }

  json j;
  try {
    file >> j;
  } catch (const json::exception &e) {
    configLogger()->error("Malformed JSON in {}: {}", path.string(), e.what());
    throw ConfigError(
        fmt::format("Malformed JSON in {}: {}", path.string(), e.what()));
  }

  ReelConfig config = parseConfig(j);
  configLogger()->info("Loaded configuration {} ({} cutouts)", path.string(),
                       config.cutouts.size());
  return config;
}

json toJson(const ReelConfig &config) {
  json cutouts = json::array();
  for (const auto &request : config.cutouts) {
    json entry = {{"id", request.id},
                  {"path", request.path.string()},
                  {"size", request.size},
                  {"title", request.title}};
    if (request.center) {
      entry["x"] = request.center->x;
      entry["y"] = request.center->y;
    }
    cutouts.push_back(std::move(entry));
  }

  return json{
      {"stats",
       {{"sigma", config.stats.sigma},
        {"max_iterations", config.stats.maxIterations}}},
      {"normalize",
       {{"match_background", config.normalize.matchBackground},
        {"match_noise", config.normalize.matchNoise},
        {"shared_range", config.sharedRange},
        {"lower_percentile", config.normalize.lowerPercentile},
        {"upper_percentile", config.normalize.upperPercentile}}},
      {"render",
       {{"colormap", config.render.colormap},
        {"flip_vertical", config.render.flipVertical},
        {"scale", config.render.scale},
        {"nan_value", config.render.nanValue},
        {"draw_titles", config.render.drawTitle}}},
      {"animation",
       {{"frame_duration_ms", config.animation.frameDurationMs},
        {"output", config.animation.output.string()},
        {"frames_dir", config.animation.framesDir.string()},
        {"grid_output", config.animation.gridOutput.string()},
        {"grid_columns", config.animation.gridColumns}}},
      {"logging",
       {{"level", config.logging.level},
        {"directory", config.logging.directory}}},
      {"cutouts", cutouts},
  };
}

} // namespace cutoutreel
