#include "Point.hpp"

namespace voroglass
{
// z-component of the cross product for 2D points
double cross(const Point<2>& a, const Point<2>& b)
{
  return a[0] * b[1] - a[1] * b[0];
}

double orient(const Point<2>& a, const Point<2>& b, const Point<2>& c)
{
  return cross(b - a, c - a);
}
}
