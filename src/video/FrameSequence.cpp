#include "FrameSequence.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fmt/format.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &animationLogger() {
  static auto logger = moduleLogger("AnimationLogger", "animation.log");
  return logger;
}

bool isPngFile(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".png";
}

void ensureParentDirectory(const fs::path &outputPath) {
  const fs::path parent = outputPath.parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    animationLogger()->error("Cannot create directory {}: {}", parent.string(),
                             ec.message());
    throw AnimationWriteError(fmt::format("Cannot create directory {}: {}",
                                          parent.string(), ec.message()));
  }
}

} // namespace

FrameSequenceAssembler::FrameSequenceAssembler(GifOptions options)
    : options_(options) {}

Animation FrameSequenceAssembler::assemble(
    std::span<const RenderedFrame> frames, int frameDurationMs,
    const fs::path &outputPath, AssemblyReport *report) const {
  if (frames.empty()) {
    animationLogger()->error("No frames to assemble into {}",
                             outputPath.string());
    throw EmptySequenceError("No rendered frames to assemble into " +
                             outputPath.string());
  }
  if (frameDurationMs <= 0) {
    animationLogger()->error("Invalid frame duration {} ms", frameDurationMs);
    throw InvalidParameterError(
        fmt::format("Frame duration must be positive, got {} ms",
                    frameDurationMs));
  }

  const auto startTime = std::chrono::steady_clock::now();
  const cv::Size screenSize = frames.front().picture.size();

  std::vector<cv::Mat> pictures;
  pictures.reserve(frames.size());
  int resized = 0;
  for (size_t i = 0; i < frames.size(); ++i) {
    const cv::Mat &picture = frames[i].picture;
    if (picture.empty()) {
      animationLogger()->error("Frame {} has no picture", i);
      throw InvalidParameterError(fmt::format("Frame {} is empty", i));
    }
    if (picture.size() == screenSize) {
      pictures.push_back(picture);
      continue;
    }
    animationLogger()->warn("Frame {} is {}x{}, resizing to {}x{}", i,
                            picture.cols, picture.rows, screenSize.width,
                            screenSize.height);
    cv::Mat fitted;
    cv::resize(picture, fitted, screenSize, 0, 0, cv::INTER_AREA);
    pictures.push_back(fitted);
    ++resized;
  }

  ensureParentDirectory(outputPath);

  const std::vector<int> delays(pictures.size(), frameDurationMs);
  GifEncoder encoder(options_);
  const std::size_t bytes = encoder.write(outputPath, pictures, delays);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - startTime)
                           .count();
  animationLogger()->info("GIF saved to {} ({} frames, {} bytes, {}ms)",
                          outputPath.string(), pictures.size(), bytes, elapsed);

  if (report) {
    report->frameCount = pictures.size();
    report->outputPath = outputPath;
    report->bytesWritten = bytes;
    report->resizedFrames = resized;
  }

  Animation animation;
  animation.frames.assign(frames.begin(), frames.end());
  animation.frameDurationMs = frameDurationMs;
  animation.loopCount = options_.loopCount;
  return animation;
}

Animation FrameSequenceAssembler::assembleDirectory(
    const fs::path &pngDirectory, const fs::path &outputPath,
    int frameDurationMs, AssemblyReport *report) const {
  std::vector<fs::path> pngFiles;
  std::error_code ec;
  if (fs::is_directory(pngDirectory, ec)) {
    for (const auto &entry : fs::directory_iterator(pngDirectory, ec)) {
      if (entry.is_regular_file() && isPngFile(entry.path())) {
        pngFiles.push_back(entry.path());
      }
    }
  }
  if (pngFiles.empty()) {
    animationLogger()->error("No PNG files found in {}", pngDirectory.string());
    throw EmptySequenceError("No PNG files found in " + pngDirectory.string());
  }
  std::sort(pngFiles.begin(), pngFiles.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().string() < b.filename().string();
            });

  std::vector<RenderedFrame> frames;
  frames.reserve(pngFiles.size());
  for (const auto &file : pngFiles) {
    cv::Mat picture = cv::imread(file.string(), cv::IMREAD_UNCHANGED);
    if (picture.empty()) {
      animationLogger()->error("Cannot read frame {}", file.string());
      throw CutoutReelError("Cannot read frame " + file.string());
    }
    if (picture.depth() != CV_8U) {
      picture.convertTo(picture, CV_8U, 1.0 / 257.0);
    }
    frames.push_back(RenderedFrame{picture, file.stem().string()});
  }

  animationLogger()->info("Loaded {} PNG frames from {}", frames.size(),
                          pngDirectory.string());
  return assemble(frames, frameDurationMs, outputPath, report);
}

Animation assembleAnimation(std::span<const RenderedFrame> frames,
                            int frameDurationMs, const fs::path &outputPath,
                            AssemblyReport *report) {
  return FrameSequenceAssembler().assemble(frames, frameDurationMs, outputPath,
                                           report);
}

GifInfo verifyWrittenAnimation(const AssemblyReport &report) {
  const auto info = inspectGif(report.outputPath);
  if (!info) {
    animationLogger()->error("Cannot read back {}: {}",
                             report.outputPath.string(),
                             errorToString(info.error()));
    throw AnimationWriteError(
        fmt::format("Written animation {} is unreadable: {}",
                    report.outputPath.string(), errorToString(info.error())));
  }
  if (static_cast<std::size_t>(info->frameCount) != report.frameCount) {
    animationLogger()->error("{} holds {} frames, expected {}",
                             report.outputPath.string(), info->frameCount,
                             report.frameCount);
    throw AnimationWriteError(
        fmt::format("Written animation {} holds {} frames instead of {}",
                    report.outputPath.string(), info->frameCount,
                    report.frameCount));
  }
  animationLogger()->debug("Verified {} ({} frames)", report.outputPath.string(),
                           info->frameCount);
  return *info;
}

} // namespace cutoutreel
