#pragma once
#include "Point.hpp"

namespace voroglass
{
// Absolute area of a simple polygon (shoelace formula). Zero for fewer than 3 vertices.
double polygonArea(const Polygon& polygon);

// Area centroid of a simple polygon, the vertex mean if its area vanishes.
Point<2> polygonCentroid(const Polygon& polygon);

/**
 * @brief Even-odd crossing test.
 *
 * Points exactly on an edge may be reported on either side. Adjacent cells are tested in order by the caller, so a
 * point on a shared edge still resolves to a single cell.
 */
bool polygonContains(const Polygon& polygon, const Point<2>& p);
}
