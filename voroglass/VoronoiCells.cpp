#include "VoronoiCells.hpp"
#include "Logger.hpp"

#include <Eigen/Dense>
#include <cmath>

using namespace voroglass;

Point<2> VoronoiCells::circumcenter(const Point<2>& a, const Point<2>& b, const Point<2>& c)
{
  // |u|^2 = |u - (b - a)|^2 = |u - (c - a)|^2 for the offset u of the center from a
  Eigen::Matrix2d m;
  m << b[0] - a[0], b[1] - a[1], c[0] - a[0], c[1] - a[1];

  double det = m.determinant();
  if (std::abs(det) < kDegenerateEpsilon)
  {
    logger.log(LogLevel::Debug, "Degenerate triangle %s %s %s, using its centroid.", a.toString().c_str(),
      b.toString().c_str(), c.toString().c_str());
    return { (a[0] + b[0] + c[0]) / 3, (a[1] + b[1] + c[1]) / 3 };
  }

  Eigen::Vector2d rhs(0.5 * m.row(0).squaredNorm(), 0.5 * m.row(1).squaredNorm());
  Eigen::Vector2d u = m.inverse() * rhs;
  return { a[0] + u[0], a[1] + u[1] };
}

std::vector<Point<2>> VoronoiCells::computeCircumcenters(const std::vector<Point<2>>& points,
  const Triangulation& triangulation)
{
  const auto& triangles = triangulation.triangles;
  std::vector<Point<2>> circumcenters(triangulation.triangleCount());

  for (size_t t = 0; t < circumcenters.size(); ++t)
  {
    circumcenters[t] = circumcenter(points[triangles[3 * t]], points[triangles[3 * t + 1]], points[triangles[3 * t + 2]]);
  }

  return circumcenters;
}

std::vector<size_t> VoronoiCells::incidentHalfedges(const Triangulation& triangulation, size_t point_count)
{
  std::vector<size_t> incident(point_count, INVALID_INDEX);

  for (size_t e = 0; e < triangulation.triangles.size(); ++e)
  {
    size_t p = triangulation.triangles[e];
    if (p >= point_count)
      continue;
    if (incident[p] == INVALID_INDEX || triangulation.halfedges[e] == INVALID_INDEX)
    {
      incident[p] = e;
    }
  }

  return incident;
}

std::vector<Point<2>> VoronoiCells::walkVertexRing(size_t start, const Triangulation& triangulation,
  const std::vector<Point<2>>& circumcenters)
{
  std::vector<Point<2>> ring;
  size_t e = start;
  size_t steps = 0;

  do
  {
    ring.push_back(circumcenters[e / 3]);
    size_t opposite = triangulation.halfedges[prevHalfedge(e)];
    if (opposite == INVALID_INDEX)
    {
      break;
    }
    e = opposite;
    if (++steps > kMaxWalkSteps)
    {
      logger.log(LogLevel::Debug, "Ring walk from half-edge %zu exceeded %zu steps.", start, kMaxWalkSteps);
      break;
    }
  } while (e != start);

  return ring;
}

std::optional<Polygon> VoronoiCells::reconstructCell(size_t site, const Triangulation& triangulation,
  const std::vector<Point<2>>& circumcenters, const std::vector<size_t>& incident)
{
  size_t start = incident[site];
  if (start == INVALID_INDEX)
  {
    VOROGLASS_DEBUG("Site " << site << " has no incident half-edge");
    return std::nullopt;
  }

  Polygon ring = walkVertexRing(start, triangulation, circumcenters);
  if (ring.size() < 3)
  {
    VOROGLASS_DEBUG("Site " << site << " has an incomplete ring of " << ring.size() << " vertices");
    return std::nullopt;
  }

  return ring;
}
