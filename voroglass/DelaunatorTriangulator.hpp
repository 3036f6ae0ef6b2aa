#pragma once
#include "Triangulator.hpp"

namespace voroglass
{
/**
 * @class DelaunatorTriangulator
 * @brief Delaunay triangulation by delaunator-cpp's sweep-hull algorithm.
 *
 * delaunator already produces the flat triangles/halfedges layout with std::numeric_limits<size_t>::max() as the hull
 * marker, so the adapter only converts the point list into interleaved coordinates. Triangles come out clockwise in a
 * y-up frame, exact duplicates are left unconnected and fully collinear input throws std::runtime_error.
 */
class DelaunatorTriangulator : public Triangulator
{
 public:
  Triangulation triangulate(const std::vector<Point<2>>& points) const override;

  const char* name() const override { return "delaunator"; }
};
}
