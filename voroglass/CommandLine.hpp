//! @file CommandLine.hpp
//! @brief Parameters of the voroglass command line tool and their parser.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace voroglass
{
/*!
 * @brief Holds the parameters of one command line run.
 */
struct VoroglassParams
{
  double width = 0.0;
  double height = 0.0;
  size_t num_cells = 120;
  std::optional<std::string> seed;
  std::optional<unsigned> shuffle_key;
  std::optional<std::pair<double, double>> viewport;
  std::string output_filename = "cells.obj";
  bool verbose = false;
  bool show_help = false;
};

//! @brief Prints the usage message.
void printHelp();

//! @brief Parses the command line arguments.
/*!
 * Options come first and are followed by the two positional arguments <width> <height>.
 *
 * @throws std::invalid_argument On unknown options, missing values or malformed numbers.
 */
VoroglassParams parseArguments(int argc, const char* const argv[]);

//! @brief The seed used for generation, combining -seed and -shuffle.
std::optional<std::string> effectiveSeed(const VoroglassParams& params);
}
