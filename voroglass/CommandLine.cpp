#include "CommandLine.hpp"
#include "StainedGlassGenerator.hpp"

#include <cctype>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

using namespace voroglass;

namespace
{
double parseDouble(const std::string& option, const std::string& value)
{
  try
  {
    size_t consumed = 0;
    double result = std::stod(value, &consumed);
    if (consumed == value.size())
      return result;
  }
  catch (const std::logic_error&)
  {
  }
  throw std::invalid_argument("Invalid number for " + option + ": " + value);
}

unsigned long parseUnsigned(const std::string& option, const std::string& value)
{
  try
  {
    size_t consumed = 0;
    if (!value.empty() && value[0] != '-')
    {
      unsigned long result = std::stoul(value, &consumed);
      if (consumed == value.size())
        return result;
    }
  }
  catch (const std::logic_error&)
  {
  }
  throw std::invalid_argument("Invalid count for " + option + ": " + value);
}
}

void voroglass::printHelp()
{
  std::cout << "Usage: voroglass [OPTIONS] <width> <height>\n\n";
  std::cout << "OPTIONS:\n";
  std::cout << "  -n {count}                  : Number of cells (default: 120).\n";
  std::cout << "  -seed {string}              : Seed for a reproducible layout (default: random).\n";
  std::cout << "  -shuffle {key}              : Reshuffle the seeded layout with an integer key.\n";
  std::cout << "  -fit {max_width} {max_height}: Fit the rectangle into a viewport before generating.\n";
  std::cout << "  -o {output_filename}        : Output OBJ file (default: cells.obj).\n";
  std::cout << "  -v                          : Enable debug logging.\n";
  std::cout << "  --help                      : Print this help message.\n";
}

VoroglassParams voroglass::parseArguments(int argc, const char* const argv[])
{
  VoroglassParams params;

  int i = 1;
  // a negative number is a positional argument, not an option
  while (i < argc && argv[i][0] == '-' && !std::isdigit(static_cast<unsigned char>(argv[i][1])))
  {
    std::string arg = argv[i];

    auto requireValues = [&](int count)
    {
      if (i + count >= argc)
        throw std::invalid_argument("Missing value for " + arg);
    };

    if (arg == "-n")
    {
      requireValues(1);
      params.num_cells = parseUnsigned(arg, argv[++i]);
    }
    else if (arg == "-seed")
    {
      requireValues(1);
      params.seed = argv[++i];
    }
    else if (arg == "-shuffle")
    {
      requireValues(1);
      unsigned long key = parseUnsigned(arg, argv[++i]);
      if (key > std::numeric_limits<unsigned>::max())
        throw std::invalid_argument("Shuffle key out of range: " + std::string(argv[i]));
      params.shuffle_key = static_cast<unsigned>(key);
    }
    else if (arg == "-fit")
    {
      requireValues(2);
      double max_width = parseDouble(arg, argv[++i]);
      double max_height = parseDouble(arg, argv[++i]);
      params.viewport = std::make_pair(max_width, max_height);
    }
    else if (arg == "-o")
    {
      requireValues(1);
      params.output_filename = argv[++i];
    }
    else if (arg == "-v")
    {
      params.verbose = true;
    }
    else if (arg == "--help" || arg == "-h")
    {
      params.show_help = true;
      return params;
    }
    else
    {
      throw std::invalid_argument("Unknown option: " + arg);
    }
    ++i;
  }

  if (i + 2 != argc)
  {
    throw std::invalid_argument("Expected <width> <height> after the options");
  }

  params.width = parseDouble("width", argv[i++]);
  params.height = parseDouble("height", argv[i++]);

  return params;
}

std::optional<std::string> voroglass::effectiveSeed(const VoroglassParams& params)
{
  if (!params.seed)
    return std::nullopt;
  if (!params.shuffle_key)
    return params.seed;
  return StainedGlassGenerator::shuffleSeed(*params.seed, *params.shuffle_key);
}
