#pragma once
#include "Point.hpp"
#include <limits>
#include <vector>

namespace voroglass
{
// Marks a half-edge on the hull that has no opposite half-edge.
constexpr size_t INVALID_INDEX = std::numeric_limits<size_t>::max();

/**
 * @struct Triangulation
 * @brief Flat triangle list with half-edge adjacency.
 *
 * Triangle `t` owns the half-edges `3t`, `3t+1` and `3t+2`. Half-edge `e` runs from `triangles[e]` to
 * `triangles[nextHalfedge(e)]`. `halfedges[e]` is the half-edge running the other way in the neighboring triangle, or
 * INVALID_INDEX on the hull.
 */
struct Triangulation
{
  std::vector<size_t> triangles; ///< Point indices, three per triangle.
  std::vector<size_t> halfedges; ///< Opposite half-edge per half-edge.

  size_t triangleCount() const { return triangles.size() / 3; }
};

inline size_t nextHalfedge(size_t e) { return (e % 3 == 2) ? e - 2 : e + 1; }
inline size_t prevHalfedge(size_t e) { return (e % 3 == 0) ? e + 2 : e - 1; }

/**
 * @class Triangulator
 * @brief Turns a point set into a Triangulation.
 *
 * Any Delaunay triangulator can be plugged in as long as the adjacency is an involution with exactly one
 * INVALID_INDEX per hull edge.
 */
class Triangulator
{
 public:
  virtual ~Triangulator() = default;

  virtual Triangulation triangulate(const std::vector<Point<2>>& points) const = 0;

  virtual const char* name() const = 0;
};

/**
 * @brief Checks the structural contract of a triangulation.
 *
 * Verifies matching sizes, point indices in range, and that every linked pair is mutual and joins reversed edges.
 * The first violation is logged as a warning.
 */
bool validateTriangulation(const Triangulation& triangulation, size_t point_count);
}
