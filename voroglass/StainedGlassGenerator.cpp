#include "StainedGlassGenerator.hpp"
#include "DelaunatorTriangulator.hpp"
#include "Logger.hpp"
#include "Polygon.hpp"
#include "PolygonClipper.hpp"
#include "SeededRandom.hpp"
#include "SiteSampler.hpp"
#include "VoronoiCells.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace voroglass;

std::vector<VoronoiCell> StainedGlassGenerator::generate(double width, double height, size_t num_cells,
  const std::optional<std::string>& seed, const Triangulator& triangulator)
{
  if (!std::isfinite(width) || !std::isfinite(height) || width <= 0 || height <= 0)
  {
    throw std::invalid_argument("Rectangle must have a finite positive size, got " + std::to_string(width) + " x "
      + std::to_string(height));
  }
  if (num_cells == 0)
  {
    throw std::invalid_argument("At least one cell is needed");
  }

  logger.log(LogLevel::Debug, "Generating %zu cells in %.2f x %.2f (%s, seed %s).", num_cells, width, height,
    triangulator.name(), seed ? seed->c_str() : "<random>");

  SeededRandom rng(seed);
  std::vector<Point<2>> sites = SiteSampler::sampleSites(width, height, num_cells, rng);

  std::vector<Point<2>> points = sites;
  std::vector<Point<2>> padding = SiteSampler::boundaryPadding(width, height);
  points.insert(points.end(), padding.begin(), padding.end());

  Triangulation triangulation = triangulator.triangulate(points);
  if (logger.isEnabled(LogLevel::Debug) && !validateTriangulation(triangulation, points.size()))
  {
    VOROGLASS_WARNING("Triangulation by " << triangulator.name() << " is malformed, cells may be dropped");
  }
  std::vector<Point<2>> circumcenters = VoronoiCells::computeCircumcenters(points, triangulation);
  std::vector<size_t> incident = VoronoiCells::incidentHalfedges(triangulation, points.size());

  PolygonClipper clipper(width, height);
  std::vector<VoronoiCell> cells;
  cells.reserve(num_cells);

  for (size_t i = 0; i < num_cells; ++i)
  {
    std::optional<Polygon> ring = VoronoiCells::reconstructCell(i, triangulation, circumcenters, incident);
    if (!ring)
      continue;

    Polygon clipped = clipper.clip(*ring);
    if (clipped.size() < 3)
    {
      VOROGLASS_DEBUG("Cell " << i << " clipped to " << clipped.size() << " vertices");
      continue;
    }

    cells.push_back({ i, sites[i], std::move(clipped) });
  }

  if (cells.size() < num_cells)
  {
    logger.log(LogLevel::Info, "Dropped %zu of %zu cells.", num_cells - cells.size(), num_cells);
  }

  return cells;
}

std::vector<VoronoiCell> StainedGlassGenerator::generate(double width, double height, size_t num_cells,
  const std::optional<std::string>& seed)
{
  DelaunatorTriangulator triangulator;
  return generate(width, height, num_cells, seed, triangulator);
}

std::optional<size_t> StainedGlassGenerator::findCellAt(const std::vector<VoronoiCell>& cells, double x, double y)
{
  Point<2> p { x, y };
  auto it = std::find_if(cells.begin(), cells.end(),
    [&p](const VoronoiCell& cell) { return polygonContains(cell.vertices, p); });
  if (it == cells.end())
    return std::nullopt;
  return it->id;
}

std::pair<double, double> StainedGlassGenerator::fitToViewport(double image_width, double image_height,
  double max_width, double max_height)
{
  if (image_width <= 0 || image_height <= 0)
  {
    throw std::invalid_argument("Image must have a positive size");
  }
  double scale = std::min({ max_width / image_width, max_height / image_height, 1.0 });
  return { std::round(image_width * scale), std::round(image_height * scale) };
}

std::string StainedGlassGenerator::shuffleSeed(const std::string& image_key, unsigned shuffle_key)
{
  return image_key + "__" + std::to_string(shuffle_key);
}
