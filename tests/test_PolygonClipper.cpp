#include "voroglass/Polygon.hpp"
#include "voroglass/PolygonClipper.hpp"

#include <catch2/catch.hpp>
#include <vector>

using namespace voroglass;
using Catch::Detail::Approx;

TEST_CASE("Polygons outside the rectangle vanish", "[PolygonClipper]")
{
  PolygonClipper clipper(100, 50);

  Polygon left = { { -30, 10 }, { -5, 10 }, { -5, 40 }, { -30, 40 } };
  REQUIRE(clipper.clip(left).empty());

  Polygon above = { { 10, 60 }, { 40, 60 }, { 25, 90 } };
  REQUIRE(clipper.clip(above).empty());

  REQUIRE(clipper.clip({}).empty());
}

TEST_CASE("Polygons inside the rectangle are unchanged", "[PolygonClipper]")
{
  PolygonClipper clipper(100, 50);
  Polygon inside = { { 10, 10 }, { 90, 5 }, { 60, 45 }, { 20, 30 } };
  REQUIRE(clipper.clip(inside) == inside);

  // vertices on the boundary count as inside
  Polygon full = { { 0, 0 }, { 100, 0 }, { 100, 50 }, { 0, 50 } };
  REQUIRE(clipper.clip(full) == full);
}

TEST_CASE("Straddling one edge replaces the outside vertices by two intersections", "[PolygonClipper]")
{
  PolygonClipper clipper(100, 100);

  SECTION("Left edge")
  {
    Polygon square = { { -10, 10 }, { 10, 10 }, { 10, 20 }, { -10, 20 } };
    Polygon expected = { { 0, 10 }, { 10, 10 }, { 10, 20 }, { 0, 20 } };
    REQUIRE(clipper.clip(square) == expected);
  }

  SECTION("Top edge")
  {
    Polygon triangle = { { 20, 80 }, { 60, 80 }, { 40, 120 } };
    Polygon clipped = clipper.clip(triangle);
    REQUIRE(clipped.size() == 4);
    REQUIRE(clipped[0][0] == Approx(30));
    REQUIRE(clipped[0][1] == 100);
    REQUIRE(clipped[1] == Point<2> { 20, 80 });
    REQUIRE(clipped[2] == Point<2> { 60, 80 });
    REQUIRE(clipped[3][0] == Approx(50));
    REQUIRE(clipped[3][1] == 100);
  }
}

TEST_CASE("Single boundary passes", "[PolygonClipper]")
{
  PolygonClipper clipper(10, 10);
  Polygon diamond = { { 5, -5 }, { 15, 5 }, { 5, 15 }, { -5, 5 } };

  Polygon right = clipper.clipAgainst(diamond, PolygonClipper::Boundary::Right);
  REQUIRE(right.size() == 5);
  for (const auto& p : right)
  {
    REQUIRE(p[0] <= 10);
  }

  REQUIRE(clipper.inside({ 0, 0 }, PolygonClipper::Boundary::Left));
  REQUIRE_FALSE(clipper.inside({ -1e-9, 0 }, PolygonClipper::Boundary::Left));
  REQUIRE(clipper.inside({ 10, 10 }, PolygonClipper::Boundary::Top));
  REQUIRE_FALSE(clipper.inside({ 0, -0.5 }, PolygonClipper::Boundary::Bottom));

  Point<2> hit = clipper.intersect({ -10, 0 }, { 10, 10 }, PolygonClipper::Boundary::Left);
  REQUIRE(hit[0] == 0);
  REQUIRE(hit[1] == Approx(5));
}

TEST_CASE("A polygon enclosing the rectangle clips to the rectangle", "[PolygonClipper]")
{
  PolygonClipper clipper(400, 300);
  Polygon big = { { -1000, -900 }, { 1500, -800 }, { 1400, 1300 }, { -1100, 1200 } };
  Polygon clipped = clipper.clip(big);

  REQUIRE(polygonArea(clipped) == Approx(400.0 * 300.0));
  for (const auto& p : clipped)
  {
    REQUIRE(p[0] >= 0);
    REQUIRE(p[0] <= 400);
    REQUIRE(p[1] >= 0);
    REQUIRE(p[1] <= 300);
  }
}
