#pragma once
#include "Point.hpp"
#include <vector>

namespace voroglass
{
/**
 * @class PolygonClipper
 * @brief Sutherland-Hodgman clipping of a polygon against the rectangle [0, width] x [0, height].
 */
class PolygonClipper
{
 public:
  enum class Boundary
  {
    Left, ///< x >= 0
    Right, ///< x <= width
    Bottom, ///< y >= 0
    Top ///< y <= height
  };

  PolygonClipper(double width, double height);

  /**
   * @brief Clips against the four boundaries in the order left, right, bottom, top.
   *
   * An empty intermediate result stops the pipeline and yields an empty polygon. The caller decides whether a result
   * with fewer than 3 vertices is usable.
   */
  Polygon clip(const Polygon& polygon) const;

  // One Sutherland-Hodgman pass against a single boundary.
  Polygon clipAgainst(const Polygon& polygon, Boundary boundary) const;

  bool inside(const Point<2>& p, Boundary boundary) const;

  // Point where the segment a-b crosses the boundary line. Only meaningful if a and b lie on different sides.
  Point<2> intersect(const Point<2>& a, const Point<2>& b, Boundary boundary) const;

  double getWidth() const { return width; }
  double getHeight() const { return height; }

 private:
  double width;
  double height;
};
}
