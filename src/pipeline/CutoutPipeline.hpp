#ifndef CUTOUTREEL_CUTOUT_PIPELINE_HPP
#define CUTOUTREEL_CUTOUT_PIPELINE_HPP

#include "ReelConfig.hpp"
#include "image/CutoutSource.hpp"
#include "image/FrameNormalizer.hpp"
#include "video/FrameSequence.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace cutoutreel {

struct SkippedCutout {
  std::string id;
  std::string reason;
};

struct PipelineResult {
  AssemblyReport report;
  NormalizedBatch batch; // Empty frames when normalization is disabled
  std::vector<std::string> used;
  std::vector<SkippedCutout> skipped;
  std::vector<std::filesystem::path> framePngs;
  std::filesystem::path gridOutput; // Empty when no montage was written
};

/**
 * @brief Fetches cutouts, normalizes them as one batch, renders and animates.
 *
 * Requests whose acquisition fails are skipped and reported; the batch
 * continues with the remaining ones.
 */
class CutoutPipeline {
public:
  CutoutPipeline(ReelConfig config, CutoutSource &source);

  /**
   * @throws EmptyInputError if no request produced a grid.
   * @throws CutoutReelError subclasses raised by the processing stages.
   */
  PipelineResult run(std::span<const CutoutRequest> requests);

  // Runs the requests listed in the configuration
  PipelineResult run();

  [[nodiscard]] const ReelConfig &config() const noexcept { return config_; }

private:
  ReelConfig config_;
  CutoutSource &source_;
};

} // namespace cutoutreel

#endif // CUTOUTREEL_CUTOUT_PIPELINE_HPP
