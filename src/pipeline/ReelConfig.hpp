#ifndef CUTOUTREEL_REEL_CONFIG_HPP
#define CUTOUTREEL_REEL_CONFIG_HPP

#include "image/CutoutSource.hpp"
#include "image/FrameNormalizer.hpp"
#include "image/FrameRenderer.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cutoutreel {

struct AnimationSettings {
  int frameDurationMs{500};
  std::filesystem::path output{"out/cutouts.gif"};
  std::filesystem::path framesDir;  // Empty: no PNG frames
  std::filesystem::path gridOutput; // Empty: no montage
  int gridColumns{5};
};

struct LoggingSettings {
  std::string level{"info"};
  std::string directory{"logs"};
};

struct ReelConfig {
  SigmaClipConfig stats;
  NormalizeConfig normalize; // normalize.clip mirrors stats after parsing
  bool sharedRange{true};
  RenderOptions render;
  AnimationSettings animation;
  LoggingSettings logging;
  std::vector<CutoutRequest> cutouts;

  // True when frames go through FrameNormalizer before rendering
  [[nodiscard]] bool normalizationEnabled() const noexcept {
    return normalize.matchBackground || normalize.matchNoise || sharedRange;
  }
};

/**
 * @brief Builds a configuration from JSON. Missing keys keep their defaults.
 * @throws ConfigError on wrong types or invalid values.
 */
[[nodiscard]] ReelConfig parseConfig(const nlohmann::json &j);

// Reads and parses a JSON file; throws ConfigError when unreadable
[[nodiscard]] ReelConfig loadConfig(const std::filesystem::path &path);

[[nodiscard]] nlohmann::json toJson(const ReelConfig &config);

// Throws ConfigError naming the first invalid value
void validateConfig(const ReelConfig &config);

} // namespace cutoutreel

#endif // CUTOUTREEL_REEL_CONFIG_HPP
