#pragma once

#include "StainedGlassGenerator.hpp"
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <string>

namespace voroglass
{
// Writes tessellations as Wavefront OBJ, one object per cell with a single polygon face in the z = 0 plane.
class CellExporter
{
 public:
  static void writeCells(const std::vector<VoronoiCell>& cells, std::ostream& out)
  {
    out << std::setprecision(12);
    out << "# Exported by voroglass CellExporter\n";
    out << "# " << cells.size() << " cells\n";

    // OBJ indices are 1-based and global across objects
    size_t vertex_offset = 1;
    for (const auto& cell : cells)
    {
      out << "o cell_" << cell.id << "\n";
      out << "# seed " << cell.seed[0] << " " << cell.seed[1] << "\n";
      for (const auto& vertex : cell.vertices)
      {
        out << "v " << vertex[0] << " " << vertex[1] << " 0\n";
      }

      out << "f";
      for (size_t i = 0; i < cell.vertices.size(); ++i)
      {
        out << " " << (vertex_offset + i);
      }
      out << "\n";
      vertex_offset += cell.vertices.size();
    }
  }

  static void writeCells(const std::vector<VoronoiCell>& cells, const std::string& filename)
  {
    std::ofstream file(filename);
    if (!file.is_open())
    {
      throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    writeCells(cells, static_cast<std::ostream&>(file));

    file.close();
  }
};
}
