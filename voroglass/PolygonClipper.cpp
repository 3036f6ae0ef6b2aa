#include "PolygonClipper.hpp"

#include <algorithm>

using namespace voroglass;

namespace
{
// Interpolates one coordinate at parameter t and keeps it within the span of the two endpoints,
// rounding must not move a clipped vertex out of the rectangle.
double lerpWithin(double from, double to, double t)
{
  double value = from + t * (to - from);
  return std::clamp(value, std::min(from, to), std::max(from, to));
}
}

PolygonClipper::PolygonClipper(double width, double height)
  : width(width)
  , height(height)
{
}

Polygon PolygonClipper::clip(const Polygon& polygon) const
{
  Polygon output = polygon;
  for (Boundary boundary : { Boundary::Left, Boundary::Right, Boundary::Bottom, Boundary::Top })
  {
    if (output.empty())
      break;
    output = clipAgainst(output, boundary);
  }
  return output;
}

Polygon PolygonClipper::clipAgainst(const Polygon& polygon, Boundary boundary) const
{
  Polygon output;
  if (polygon.empty())
    return output;

  output.reserve(polygon.size() + 1);

  const Point<2>* prev = &polygon.back();
  for (const Point<2>& curr : polygon)
  {
    bool curr_inside = inside(curr, boundary);
    bool prev_inside = inside(*prev, boundary);

    if (curr_inside)
    {
      if (!prev_inside)
        output.push_back(intersect(*prev, curr, boundary)); // entering
      output.push_back(curr);
    }
    else if (prev_inside)
    {
      output.push_back(intersect(*prev, curr, boundary)); // leaving
    }
    prev = &curr;
  }

  return output;
}

bool PolygonClipper::inside(const Point<2>& p, Boundary boundary) const
{
  switch (boundary)
  {
  case Boundary::Left:
    return p[0] >= 0;
  case Boundary::Right:
    return p[0] <= width;
  case Boundary::Bottom:
    return p[1] >= 0;
  case Boundary::Top:
    return p[1] <= height;
  }
  return false;
}

Point<2> PolygonClipper::intersect(const Point<2>& a, const Point<2>& b, Boundary boundary) const
{
  switch (boundary)
  {
  case Boundary::Left:
  {
    double t = -a[0] / (b[0] - a[0]);
    return { 0.0, lerpWithin(a[1], b[1], t) };
  }
  case Boundary::Right:
  {
    double t = (width - a[0]) / (b[0] - a[0]);
    return { width, lerpWithin(a[1], b[1], t) };
  }
  case Boundary::Bottom:
  {
    double t = -a[1] / (b[1] - a[1]);
    return { lerpWithin(a[0], b[0], t), 0.0 };
  }
  case Boundary::Top:
  {
    double t = (height - a[1]) / (b[1] - a[1]);
    return { lerpWithin(a[0], b[0], t), height };
  }
  }
  return a;
}
