#pragma once
#include "Point.hpp"
#include "Triangulator.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace voroglass
{
/**
 * @struct VoronoiCell
 * @brief One clipped cell of a tessellation.
 */
struct VoronoiCell
{
  size_t id; ///< Index of the generating site.
  Point<2> seed; ///< The generating site.
  Polygon vertices; ///< Clipped polygon in walk order.
};

/**
 * @class StainedGlassGenerator
 * @brief Partitions a rectangle into irregular convex cells around jittered sites.
 *
 * The pipeline samples sites, pads them with 8 far anchors, triangulates, turns circumcenters into Voronoi rings and
 * clips each ring to the rectangle. A site whose cell cannot be built is left out, so the result may hold fewer cells
 * than requested. Ids stay stable for a fixed seed, which is what external annotations are keyed on.
 */
class StainedGlassGenerator
{
 public:
  // Cell count of a stained-glass overlay when none is given.
  static constexpr size_t kDefaultCellCount = 120;

  /**
   * @brief Generates the cells of a width x height rectangle.
   *
   * @param width Rectangle width, finite and positive.
   * @param height Rectangle height, finite and positive.
   * @param num_cells Number of sites, at least one.
   * @param seed Deterministic seed, a random layout without one.
   * @param triangulator Delaunay triangulation used for the sites and padding.
   * @return Cells in ascending id order, every vertex within [0, width] x [0, height].
   * @throws std::invalid_argument If a precondition is violated.
   */
  static std::vector<VoronoiCell> generate(double width, double height, size_t num_cells,
    const std::optional<std::string>& seed, const Triangulator& triangulator);

  // Same as above with the delaunator triangulator.
  static std::vector<VoronoiCell> generate(double width, double height, size_t num_cells = kDefaultCellCount,
    const std::optional<std::string>& seed = std::nullopt);

  // Id of the first cell containing (x, y), if any.
  static std::optional<size_t> findCellAt(const std::vector<VoronoiCell>& cells, double x, double y);

  /**
   * @brief Display size of an image fitted into a viewport without upscaling.
   * @return (round(image_width * scale), round(image_height * scale)) with scale = min(max_w / w, max_h / h, 1).
   */
  static std::pair<double, double> fitToViewport(double image_width, double image_height, double max_width,
    double max_height);

  // Seed of a reshuffled layout for the same image.
  static std::string shuffleSeed(const std::string& image_key, unsigned shuffle_key);
};
}
