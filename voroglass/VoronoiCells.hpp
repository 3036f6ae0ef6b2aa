#pragma once
#include "Point.hpp"
#include "Triangulator.hpp"
#include <optional>
#include <vector>

namespace voroglass
{
// Derives the Voronoi cells of a point set from its Delaunay triangulation.
class VoronoiCells
{
 public:
  VoronoiCells() = delete;
  ~VoronoiCells() = delete;

  // Determinant threshold below which a triangle counts as collinear.
  static constexpr double kDegenerateEpsilon = 1e-10;
  // Upper bound on the steps of a ring walk, guards against malformed adjacency.
  static constexpr size_t kMaxWalkSteps = 200;

  /**
   * @brief Circumcenter of the triangle (a, b, c).
   *
   * Solves the perpendicular bisector system relative to a. Nearly collinear triangles return their centroid so the
   * result is always finite.
   */
  static Point<2> circumcenter(const Point<2>& a, const Point<2>& b, const Point<2>& c);

  // One circumcenter per triangle, indexed by triangle id.
  static std::vector<Point<2>> computeCircumcenters(const std::vector<Point<2>>& points,
    const Triangulation& triangulation);

  /**
   * @brief Picks one outgoing half-edge per point, INVALID_INDEX for points no triangle uses.
   *
   * The first half-edge seen is kept unless a hull half-edge (no opposite) starts at the same point, in which case the
   * last such hull half-edge wins. Starting on the hull lets the walk of a hull vertex cover its whole open fan.
   */
  static std::vector<size_t> incidentHalfedges(const Triangulation& triangulation, size_t point_count);

  /**
   * @brief Collects the circumcenters around the origin of `start`.
   *
   * Moves to the opposite of the previous half-edge after each triangle. The walk ends back at `start`, on a hull
   * half-edge, or after kMaxWalkSteps steps.
   */
  static std::vector<Point<2>> walkVertexRing(size_t start, const Triangulation& triangulation,
    const std::vector<Point<2>>& circumcenters);

  /**
   * @brief The unclipped Voronoi polygon of `site`.
   * @return std::nullopt if the site has no incident half-edge or its ring has fewer than 3 vertices.
   */
  static std::optional<Polygon> reconstructCell(size_t site, const Triangulation& triangulation,
    const std::vector<Point<2>>& circumcenters, const std::vector<size_t>& incident);
};
}
