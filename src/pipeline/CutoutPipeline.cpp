#include "CutoutPipeline.hpp"
#include "image/CutoutGrid.hpp"
#include "image/FrameRenderer.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <chrono>
#include <fmt/format.h>
#include <opencv2/imgcodecs.hpp>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &pipelineLogger() {
  static auto logger = moduleLogger("PipelineLogger", "pipeline.log");
  return logger;
}

void writeGrid(const fs::path &path, const cv::Mat &grid) {
  const fs::path parent = path.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
  }
  if (ec || !cv::imwrite(path.string(), grid)) {
    pipelineLogger()->error("Failed to write grid montage {}", path.string());
    throw CutoutReelError("Failed to write grid montage " + path.string());
  }
}

} // namespace

CutoutPipeline::CutoutPipeline(ReelConfig config, CutoutSource &source)
    : config_(std::move(config)), source_(source) {
  validateConfig(config_);
  config_.normalize.clip = config_.stats;
}

PipelineResult CutoutPipeline::run() { return run(config_.cutouts); }

PipelineResult CutoutPipeline::run(std::span<const CutoutRequest> requests) {
  const auto startTime = std::chrono::steady_clock::now();
  PipelineResult result;

  std::vector<cv::Mat> grids;
  std::vector<std::string> titles;
  for (const auto &request : requests) {
    auto grid = source_.fetch(request);
    if (!grid) {
      const std::string reason =
          fmt::format("{}: {}", errorToString(grid.error().code),
                      grid.error().message);
      pipelineLogger()->warn("Skipping cutout '{}': {}", request.id, reason);
      result.skipped.push_back({request.id, reason});
      continue;
    }
    grids.push_back(std::move(*grid));
    titles.push_back(request.title.empty() ? request.id : request.title);
    result.used.push_back(request.id);
  }

  if (grids.empty()) {
    pipelineLogger()->error("None of the {} cutouts could be acquired",
                            requests.size());
    throw EmptyInputError(fmt::format(
        "None of the {} requested cutouts could be acquired", requests.size()));
  }
  pipelineLogger()->info("Acquired {} cutouts, skipped {}", grids.size(),
                         result.skipped.size());

  const std::span<const std::string> frameTitles =
      config_.render.drawTitle ? std::span<const std::string>(titles)
                               : std::span<const std::string>();

  std::vector<RenderedFrame> frames;
  if (config_.normalizationEnabled()) {
    result.batch = normalizeFrames(grids, config_.normalize);
    const std::optional<DisplayRange> range =
        config_.sharedRange ? std::optional<DisplayRange>(result.batch.range())
                            : std::nullopt;
    frames = renderFrames(result.batch.frames, range, config_.render,
                          frameTitles);
  } else {
    frames = renderFrames(grids, std::nullopt, config_.render, frameTitles);
  }

  if (!config_.animation.framesDir.empty()) {
    result.framePngs = writeFramePngs(frames, config_.animation.framesDir);
  }

  FrameSequenceAssembler assembler;
  assembler.assemble(frames, config_.animation.frameDurationMs,
                     config_.animation.output, &result.report);

  if (!config_.animation.gridOutput.empty()) {
    GridOptions gridOptions;
    gridOptions.columns = config_.animation.gridColumns;
    gridOptions.flipVertical = config_.render.flipVertical;
    if (config_.render.drawTitle) {
      gridOptions.titles = titles;
    }
    writeGrid(config_.animation.gridOutput,
              renderCutoutGrid(grids, gridOptions));
    result.gridOutput = config_.animation.gridOutput;
    pipelineLogger()->info("Grid montage saved to {}",
                           result.gridOutput.string());
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - startTime)
                           .count();
  pipelineLogger()->info("Pipeline finished in {}ms: {} frames -> {}", elapsed,
                         frames.size(), result.report.outputPath.string());
  return result;
}

} // namespace cutoutreel
