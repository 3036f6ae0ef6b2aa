#include "voroglass/SiteSampler.hpp"

#include <catch2/catch.hpp>
#include <cmath>
#include <vector>

using namespace voroglass;
using Catch::Detail::Approx;

namespace
{
void requireInterior(const std::vector<Point<2>>& sites, double width, double height)
{
  for (const auto& site : sites)
  {
    REQUIRE(site[0] >= 1.0);
    REQUIRE(site[0] <= width - 1.0);
    REQUIRE(site[1] >= 1.0);
    REQUIRE(site[1] <= height - 1.0);
  }
}
}

TEST_CASE("Grid shape follows the aspect ratio", "[SiteSampler]")
{
  REQUIRE(SiteSampler::gridShape(400, 300, 50) == std::pair<size_t, size_t>(8, 6));
  REQUIRE(SiteSampler::gridShape(400, 300, 120) == std::pair<size_t, size_t>(13, 9));
  REQUIRE(SiteSampler::gridShape(100, 100, 7) == std::pair<size_t, size_t>(3, 2));

  // both dimensions are at least one
  REQUIRE(SiteSampler::gridShape(1000, 10, 5) == std::pair<size_t, size_t>(22, 1));
  REQUIRE(SiteSampler::gridShape(10, 1000, 3) == std::pair<size_t, size_t>(1, 3));
}

TEST_CASE("Sampling yields exactly the requested number of interior sites", "[SiteSampler]")
{
  SECTION("Grid covers more than needed")
  {
    SeededRandom rng(std::optional<std::string>("wide"));
    auto sites = SiteSampler::sampleSites(1000, 10, 5, rng);
    REQUIRE(sites.size() == 5);
    requireInterior(sites, 1000, 10);

    // first row of a 22 column grid
    double cell_w = 1000.0 / 22;
    for (size_t i = 0; i < sites.size(); ++i)
    {
      REQUIRE(sites[i][0] >= (i + 0.15) * cell_w);
      REQUIRE(sites[i][0] <= (i + 0.85) * cell_w);
    }
  }

  SECTION("Grid falls short and is filled uniformly")
  {
    SeededRandom rng(std::optional<std::string>("short"));
    auto sites = SiteSampler::sampleSites(400, 300, 50, rng);
    REQUIRE(sites.size() == 50);
    requireInterior(sites, 400, 300);
  }

  SECTION("Square grid with a remainder")
  {
    SeededRandom rng(std::optional<std::string>("square"));
    auto sites = SiteSampler::sampleSites(100, 100, 7, rng);
    REQUIRE(sites.size() == 7);
    requireInterior(sites, 100, 100);
  }
}

TEST_CASE("A single site is jittered around the center", "[SiteSampler]")
{
  SeededRandom rng(std::optional<std::string>("a"));
  auto sites = SiteSampler::sampleSites(400, 300, 1, rng);
  REQUIRE(sites.size() == 1);
  REQUIRE(sites[0][0] == Approx(218.36345232091844));
  REQUIRE(sites[0][1] == Approx(91.0950125916861));
}

TEST_CASE("Jitter stays within 35 percent of the grid cell", "[SiteSampler]")
{
  SeededRandom rng(std::optional<std::string>("jitter"));
  const double width = 600;
  const double height = 400;
  auto sites = SiteSampler::sampleSites(width, height, 24, rng);
  auto [cols, rows] = SiteSampler::gridShape(width, height, 24);
  REQUIRE(cols * rows == 24);

  double cell_w = width / cols;
  double cell_h = height / rows;
  for (size_t i = 0; i < sites.size(); ++i)
  {
    double cx = (i % cols + 0.5) * cell_w;
    double cy = (i / cols + 0.5) * cell_h;
    REQUIRE(std::abs(sites[i][0] - cx) <= 0.35 * cell_w + 1e-9);
    REQUIRE(std::abs(sites[i][1] - cy) <= 0.35 * cell_h + 1e-9);
  }
}

TEST_CASE("Boundary padding surrounds the rectangle", "[SiteSampler]")
{
  auto padding = SiteSampler::boundaryPadding(400, 300);
  REQUIRE(padding.size() == SiteSampler::kPaddingCount);

  const double pad = 1200;
  REQUIRE(padding[0] == Point<2> { -pad, -pad });
  REQUIRE(padding[1] == Point<2> { 200, -pad });
  REQUIRE(padding[2] == Point<2> { 400 + pad, -pad });
  REQUIRE(padding[3] == Point<2> { 400 + pad, 150 });
  REQUIRE(padding[4] == Point<2> { 400 + pad, 300 + pad });
  REQUIRE(padding[5] == Point<2> { 200, 300 + pad });
  REQUIRE(padding[6] == Point<2> { -pad, 300 + pad });
  REQUIRE(padding[7] == Point<2> { -pad, 150 });
}
