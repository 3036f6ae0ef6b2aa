#include "Triangulator.hpp"
#include "Logger.hpp"

using namespace voroglass;

bool voroglass::validateTriangulation(const Triangulation& triangulation, size_t point_count)
{
  const auto& triangles = triangulation.triangles;
  const auto& halfedges = triangulation.halfedges;

  if (triangles.size() % 3 != 0 || halfedges.size() != triangles.size())
  {
    logger.log(LogLevel::Warning, "Triangulation has %zu indices and %zu half-edges.", triangles.size(),
      halfedges.size());
    return false;
  }

  for (size_t e = 0; e < triangles.size(); ++e)
  {
    if (triangles[e] >= point_count)
    {
      logger.log(LogLevel::Warning, "Half-edge %zu starts at point %zu, only %zu points exist.", e, triangles[e],
        point_count);
      return false;
    }

    size_t opposite = halfedges[e];
    if (opposite == INVALID_INDEX)
    {
      continue;
    }

    if (opposite >= halfedges.size() || halfedges[opposite] != e)
    {
      logger.log(LogLevel::Warning, "Half-edge %zu is not linked back by its opposite.", e);
      return false;
    }

    if (triangles[opposite] != triangles[nextHalfedge(e)] || triangles[nextHalfedge(opposite)] != triangles[e])
    {
      logger.log(LogLevel::Warning, "Half-edges %zu and %zu do not share reversed endpoints.", e, opposite);
      return false;
    }
  }

  return true;
}
