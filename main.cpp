#include "voroglass/CellExporter.hpp"
#include "voroglass/CommandLine.hpp"
#include "voroglass/Logger.hpp"
#include "voroglass/Polygon.hpp"
#include "voroglass/StainedGlassGenerator.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <tuple>

static int run(const voroglass::VoroglassParams& params)
{
  if (params.verbose)
  {
    voroglass::logger.setLogLevel(voroglass::LogLevel::Debug);
  }

  double width = params.width;
  double height = params.height;
  if (params.viewport)
  {
    std::tie(width, height) = voroglass::StainedGlassGenerator::fitToViewport(width, height, params.viewport->first,
      params.viewport->second);
    voroglass::logger.log(voroglass::LogLevel::Info, "Fitted %.0f x %.0f into the viewport as %.0f x %.0f.",
      params.width, params.height, width, height);
  }

  if (params.shuffle_key && !params.seed)
  {
    VOROGLASS_WARNING("-shuffle has no effect without -seed");
  }

  auto cells = voroglass::StainedGlassGenerator::generate(width, height, params.num_cells,
    voroglass::effectiveSeed(params));

  double covered = 0.0;
  for (const auto& cell : cells)
  {
    covered += voroglass::polygonArea(cell.vertices);
  }

  voroglass::CellExporter::writeCells(cells, params.output_filename);
  voroglass::logger.log(voroglass::LogLevel::Info, "Wrote %zu cells covering %.1f%% of %.0f x %.0f to %s.",
    cells.size(), 100.0 * covered / (width * height), width, height, params.output_filename.c_str());
  return 0;
}

int main(int argc, char* argv[])
{
  try
  {
    voroglass::VoroglassParams params = voroglass::parseArguments(argc, argv);
    if (params.show_help)
    {
      voroglass::printHelp();
      return 0;
    }
    return run(params);
  }
  catch (const std::invalid_argument& e)
  {
    voroglass::logger.log(voroglass::LogLevel::Error, std::string(e.what()));
    voroglass::printHelp();
    return 2;
  }
  catch (const std::exception& e)
  {
    voroglass::logger.log(voroglass::LogLevel::Error, std::string(e.what()));
    return 1;
  }
}
