#include "image/CutoutSource.hpp"
#include "pipeline/CutoutPipeline.hpp"
#include "pipeline/ReelConfig.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <CLI/CLI.hpp>
#include <cstdio>
#include <exception>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace cutoutreel;

namespace {

constexpr int EXIT_USAGE = 2;

bool isJsonFile(const std::string &path) {
  return fs::path(path).extension() == ".json";
}

std::vector<CutoutRequest> requestsFromFiles(
    const std::vector<std::string> &files) {
  std::vector<CutoutRequest> requests;
  requests.reserve(files.size());
  for (const auto &file : files) {
    CutoutRequest request;
    request.path = file;
    request.id = request.path.stem().string();
    requests.push_back(std::move(request));
  }
  return requests;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Builds a looping GIF from a batch of image cutouts"};

  std::string configPath;
  std::string output;
  int durationMs = 0;
  bool noBackground = false;
  bool matchNoise = false;
  std::string framesDir;
  std::vector<std::string> files;

  auto *configOpt =
      app.add_option("--config", configPath, "JSON configuration file");
  auto *outputOpt = app.add_option("-o,--output", output, "Output GIF path");
  auto *durationOpt = app.add_option("--duration", durationMs,
                                     "Display time of each frame in ms");
  app.add_flag("--no-background", noBackground,
               "Keep each frame's background level");
  app.add_flag("--match-noise", matchNoise,
               "Divide each frame by its robust noise estimate");
  auto *framesOpt = app.add_option("--frames-dir", framesDir,
                                   "Also write the rendered frames as PNG");
  app.add_option("files", files, "FITS or image files, one frame each");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const int code = app.exit(e);
    return code == 0 ? 0 : EXIT_USAGE;
  }

  // A lone JSON argument is taken as the configuration file
  if (configOpt->count() == 0 && files.size() == 1 && isJsonFile(files[0])) {
    configPath = files[0];
    files.clear();
  }

  try {
    ReelConfig config =
        configPath.empty() ? ReelConfig{} : loadConfig(configPath);

    if (outputOpt->count() > 0) {
      config.animation.output = output;
    }
    if (durationOpt->count() > 0) {
      config.animation.frameDurationMs = durationMs;
    }
    if (noBackground) {
      config.normalize.matchBackground = false;
    }
    if (matchNoise) {
      config.normalize.matchNoise = true;
    }
    if (framesOpt->count() > 0) {
      config.animation.framesDir = framesDir;
    }
    if (!files.empty()) {
      config.cutouts = requestsFromFiles(files);
    }
    validateConfig(config);

    if (config.cutouts.empty()) {
      fmt::print(stderr, "No input files given\n\n{}", app.help());
      return EXIT_USAGE;
    }

    setLogDirectory(config.logging.directory);
    setLogLevel(config.logging.level);
    spdlog::set_default_logger(moduleLogger("cutoutreel", "cutoutreel.log"));
    spdlog::info("Processing {} cutouts into {}", config.cutouts.size(),
                 config.animation.output.string());

    FileCutoutSource source;
    CutoutPipeline pipeline(config, source);
    const PipelineResult result = pipeline.run();
    (void)verifyWrittenAnimation(result.report);

    for (const auto &skipped : result.skipped) {
      fmt::print(stderr, "skipped {}: {}\n", skipped.id, skipped.reason);
    }
    fmt::print("{} ({} frames, {} bytes)\n", result.report.outputPath.string(),
               result.report.frameCount, result.report.bytesWritten);
    if (!result.gridOutput.empty()) {
      fmt::print("{}\n", result.gridOutput.string());
    }
    spdlog::info("Done");
    return 0;
  } catch (const CutoutReelError &e) {
    spdlog::error("{}", e.what());
    fmt::print(stderr, "error: {}\n", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::critical("Unexpected failure: {}", e.what());
    fmt::print(stderr, "error: {}\n", e.what());
    return 1;
  }
}
