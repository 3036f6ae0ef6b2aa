#include "Polygon.hpp"

#include <cmath>

namespace voroglass
{
namespace
{
double signedDoubleArea(const Polygon& polygon)
{
  double sum = 0.0;
  for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++)
  {
    sum += cross(polygon[j], polygon[i]);
  }
  return sum;
}
}

double polygonArea(const Polygon& polygon)
{
  if (polygon.size() < 3)
    return 0.0;
  return std::abs(signedDoubleArea(polygon)) / 2;
}

Point<2> polygonCentroid(const Polygon& polygon)
{
  Point<2> mean { 0.0, 0.0 };
  if (polygon.empty())
    return mean;

  for (const auto& p : polygon)
  {
    mean = mean + p;
  }
  mean = mean * (1.0 / static_cast<double>(polygon.size()));

  double twice_area = polygon.size() < 3 ? 0.0 : signedDoubleArea(polygon);
  if (std::abs(twice_area) < 1e-12)
    return mean;

  Point<2> centroid { 0.0, 0.0 };
  for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++)
  {
    double w = cross(polygon[j], polygon[i]);
    centroid = centroid + (polygon[j] + polygon[i]) * w;
  }
  return centroid * (1.0 / (3.0 * twice_area));
}

bool polygonContains(const Polygon& polygon, const Point<2>& p)
{
  bool inside = false;
  for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++)
  {
    const Point<2>& a = polygon[i];
    const Point<2>& b = polygon[j];
    if ((a[1] > p[1]) != (b[1] > p[1]) && p[0] < (b[0] - a[0]) * (p[1] - a[1]) / (b[1] - a[1]) + a[0])
    {
      inside = !inside;
    }
  }
  return inside;
}
}
