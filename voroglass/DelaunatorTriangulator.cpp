#include "DelaunatorTriangulator.hpp"
#include "Logger.hpp"

#include <delaunator.hpp>
#include <utility>

using namespace voroglass;

Triangulation DelaunatorTriangulator::triangulate(const std::vector<Point<2>>& points) const
{
  Triangulation result;
  if (points.size() < 3)
  {
    logger.log(LogLevel::Warning, "Cannot triangulate %zu points.", points.size());
    return result;
  }

  std::vector<double> coords;
  coords.reserve(points.size() * 2);
  for (const auto& point : points)
  {
    coords.push_back(point[0]);
    coords.push_back(point[1]);
  }

  // collinear input makes delaunator throw std::runtime_error, which propagates to the caller
  delaunator::Delaunator sweep(coords);

  static_assert(delaunator::INVALID_INDEX == INVALID_INDEX, "hull markers must agree");

  result.triangles = std::move(sweep.triangles);
  result.halfedges = std::move(sweep.halfedges);

  logger.log(LogLevel::Debug, "delaunator: %zu points, %zu triangles.", points.size(), result.triangleCount());
  return result;
}
