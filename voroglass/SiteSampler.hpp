#pragma once
#include "Point.hpp"
#include "SeededRandom.hpp"
#include <utility>
#include <vector>

namespace voroglass
{
// Places Voronoi sites inside a rectangle and the far anchors that keep their cells bounded.
class SiteSampler
{
 public:
  SiteSampler() = delete;
  ~SiteSampler() = delete;

  // Relative jitter of a site around its grid cell center, as a fraction of the cell extent.
  static constexpr double kJitter = 0.7;
  // Distance of the padding anchors from the rectangle, in multiples of its larger side.
  static constexpr double kPaddingFactor = 3.0;
  static constexpr size_t kPaddingCount = 8;

  /**
   * @brief Samples exactly `count` sites on a jittered grid.
   *
   * The grid has `round(sqrt(count * width / height))` columns and `round(count / cols)` rows, both at least one. One
   * site is placed per grid cell in row-major order and clamped to [1, width-1] x [1, height-1]. A rounding shortfall
   * is filled with uniform points. The order of the result defines the site ids.
   *
   * @param width Rectangle width.
   * @param height Rectangle height.
   * @param count Number of sites.
   * @param rng Random stream, consumed x before y for every site.
   */
  static std::vector<Point<2>> sampleSites(double width, double height, size_t count, SeededRandom& rng);

  // Grid dimensions used by sampleSites as (cols, rows).
  static std::pair<size_t, size_t> gridShape(double width, double height, size_t count);

  /**
   * @brief The 8 anchors around the rectangle at distance `3 * max(width, height)`.
   *
   * Corners and edge midpoints of the padded square, counter-clockwise starting at the lower left corner.
   */
  static std::vector<Point<2>> boundaryPadding(double width, double height);
};
}
