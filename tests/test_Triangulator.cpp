#include "voroglass/Triangulator.hpp"

#include <catch2/catch.hpp>

using namespace voroglass;

TEST_CASE("Half-edge helpers stay inside their triangle", "[Triangulator]")
{
  REQUIRE(nextHalfedge(0) == 1);
  REQUIRE(nextHalfedge(2) == 0);
  REQUIRE(nextHalfedge(5) == 3);
  REQUIRE(prevHalfedge(0) == 2);
  REQUIRE(prevHalfedge(4) == 3);
  REQUIRE(prevHalfedge(3) == 5);
}

TEST_CASE("Validation rejects broken adjacency", "[Triangulator]")
{
  Triangulation t;
  t.triangles = { 0, 1, 2, 0, 2, 3 };
  t.halfedges = { INVALID_INDEX, INVALID_INDEX, 3, 2, INVALID_INDEX, INVALID_INDEX };
  REQUIRE(validateTriangulation(t, 4));

  SECTION("Not an involution")
  {
    t.halfedges[3] = INVALID_INDEX;
    REQUIRE_FALSE(validateTriangulation(t, 4));
  }

  SECTION("Edges that are not reversed")
  {
    t.halfedges[2] = 4;
    t.halfedges[4] = 2;
    t.halfedges[3] = INVALID_INDEX;
    REQUIRE_FALSE(validateTriangulation(t, 4));
  }

  SECTION("Point index out of range")
  {
    REQUIRE_FALSE(validateTriangulation(t, 3));
  }

  SECTION("Size mismatch")
  {
    t.halfedges.pop_back();
    REQUIRE_FALSE(validateTriangulation(t, 4));
  }
}
