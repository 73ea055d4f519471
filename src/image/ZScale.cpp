#include "ZScale.hpp"
#include "RobustStats.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <cmath>

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &zscaleLogger() {
  static auto logger = moduleLogger("RenderLogger", "render.log");
  return logger;
}

struct LineFit {
  double slope{0.0};
  double intercept{0.0};
};

// Least squares line through the samples not flagged as bad
LineFit fitLine(const std::vector<double> &samples,
                const std::vector<bool> &bad) {
  double n = 0.0, sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
  for (size_t i = 0; i < samples.size(); ++i) {
    if (bad[i]) {
      continue;
    }
    const double x = static_cast<double>(i);
    n += 1.0;
    sx += x;
    sy += samples[i];
    sxx += x * x;
    sxy += x * samples[i];
  }
  LineFit fit;
  const double denom = n * sxx - sx * sx;
  if (n > 0.0 && denom != 0.0) {
    fit.slope = (n * sxy - sx * sy) / denom;
    fit.intercept = (sy - fit.slope * sx) / n;
  } else if (n > 0.0) {
    fit.intercept = sy / n;
  }
  return fit;
}

// Grows every rejected sample over a window of `width` neighbours
std::vector<bool> dilate(const std::vector<bool> &bad, int width) {
  const int n = static_cast<int>(bad.size());
  const int ahead = (width - 1) / 2;
  const int behind = (width - 1) - ahead;
  std::vector<bool> grown(bad.size(), false);
  for (int i = 0; i < n; ++i) {
    const int lo = std::max(0, i - behind);
    const int hi = std::min(n - 1, i + ahead);
    for (int j = lo; j <= hi; ++j) {
      if (bad[j]) {
        grown[i] = true;
        break;
      }
    }
  }
  return grown;
}

} // namespace

DisplayRange zscaleInterval(const cv::Mat &grid, const ZScaleConfig &config) {
  const std::vector<double> values = finiteSamples(grid);
  if (values.empty()) {
    return DisplayRange{0.0, 1.0};
  }

  const int nSamples = std::max(1, config.nSamples);
  const size_t stride = std::max<size_t>(
      1, static_cast<size_t>(static_cast<double>(values.size()) / nSamples));
  std::vector<double> samples;
  for (size_t i = 0; i < values.size() && samples.size() <
                                              static_cast<size_t>(nSamples);
       i += stride) {
    samples.push_back(values[i]);
  }
  std::sort(samples.begin(), samples.end());

  const int npix = static_cast<int>(samples.size());
  double vmin = samples.front();
  double vmax = samples.back();

  const int minPixels =
      std::max(config.minPixels, static_cast<int>(npix * config.maxReject));
  const int grow = std::max(1, static_cast<int>(npix * 0.01));

  std::vector<bool> bad(samples.size(), false);
  int goodCount = npix;
  int lastGoodCount = npix + 1;
  LineFit fit;

  for (int iter = 0; iter < config.maxIterations; ++iter) {
    if (goodCount >= lastGoodCount || goodCount < minPixels) {
      break;
    }

    fit = fitLine(samples, bad);

    std::vector<double> residuals(samples.size());
    std::vector<double> goodResiduals;
    for (int i = 0; i < npix; ++i) {
      residuals[i] = samples[i] - (fit.slope * i + fit.intercept);
      if (!bad[i]) {
        goodResiduals.push_back(residuals[i]);
      }
    }
    const double threshold = config.krej * standardDeviation(goodResiduals);

    for (int i = 0; i < npix; ++i) {
      if (residuals[i] < -threshold || residuals[i] > threshold) {
        bad[i] = true;
      }
    }
    bad = dilate(bad, grow);

    lastGoodCount = goodCount;
    goodCount = static_cast<int>(std::count(bad.begin(), bad.end(), false));
  }

  if (goodCount >= minPixels) {
    double slope = fit.slope;
    if (config.contrast > 0.0) {
      slope /= config.contrast;
    }
    const int center = (npix - 1) / 2;
    const double med = median(samples);
    vmin = std::max(vmin, med - (center - 1) * slope);
    vmax = std::min(vmax, med + (npix - center) * slope);
  }

  zscaleLogger()->debug("ZScale over {} samples: [{:.6g}, {:.6g}]", npix,
                        vmin, vmax);
  return DisplayRange{vmin, vmax};
}

} // namespace cutoutreel
