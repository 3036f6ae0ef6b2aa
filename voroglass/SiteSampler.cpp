#include "SiteSampler.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>

using namespace voroglass;

namespace
{
double clampInterior(double value, double extent)
{
  // max/min instead of std::clamp: the interval is empty for extents below 2
  return std::max(1.0, std::min(extent - 1.0, value));
}
}

std::pair<size_t, size_t> SiteSampler::gridShape(double width, double height, size_t count)
{
  double aspect = width / height;
  size_t cols = static_cast<size_t>(std::round(std::sqrt(static_cast<double>(count) * aspect)));
  cols = std::max<size_t>(cols, 1);
  size_t rows = static_cast<size_t>(std::round(static_cast<double>(count) / static_cast<double>(cols)));
  rows = std::max<size_t>(rows, 1);
  return { cols, rows };
}

std::vector<Point<2>> SiteSampler::sampleSites(double width, double height, size_t count, SeededRandom& rng)
{
  auto [cols, rows] = gridShape(width, height, count);
  double cell_w = width / static_cast<double>(cols);
  double cell_h = height / static_cast<double>(rows);

  std::vector<Point<2>> sites;
  sites.reserve(count);

  for (size_t r = 0; r < rows && sites.size() < count; ++r)
  {
    for (size_t c = 0; c < cols && sites.size() < count; ++c)
    {
      double x = (static_cast<double>(c) + 0.5) * cell_w + (rng() - 0.5) * cell_w * kJitter;
      double y = (static_cast<double>(r) + 0.5) * cell_h + (rng() - 0.5) * cell_h * kJitter;
      sites.push_back({ clampInterior(x, width), clampInterior(y, height) });
    }
  }

  if (sites.size() < count)
  {
    logger.log(LogLevel::Debug, "Grid %zux%zu covers %zu of %zu sites, filling the rest uniformly.", cols, rows,
      sites.size(), count);
  }

  while (sites.size() < count)
  {
    double x = rng() * (width - 2.0) + 1.0;
    double y = rng() * (height - 2.0) + 1.0;
    sites.push_back({ x, y });
  }

  sites.resize(count);
  return sites;
}

std::vector<Point<2>> SiteSampler::boundaryPadding(double width, double height)
{
  double pad = std::max(width, height) * kPaddingFactor;
  return {
    { -pad, -pad },
    { width / 2, -pad },
    { width + pad, -pad },
    { width + pad, height / 2 },
    { width + pad, height + pad },
    { width / 2, height + pad },
    { -pad, height + pad },
    { -pad, height / 2 },
  };
}
