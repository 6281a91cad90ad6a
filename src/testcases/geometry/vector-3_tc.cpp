
#include <algorithm>
#include <iterator>
#include <random>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/geometry/line-1d.hpp"
#include "spindle/geometry/vector-3.hpp"

namespace spindle
{
CATCH_TEST_CASE("Vector3", "[vector-3]")
{
   CATCH_SECTION("normalize")
   {
      std::mt19937 g;
      g.seed(0);
      std::uniform_real_distribution<real> dist(-10.0, 10.0);
      for(auto i = 0; i < 100; ++i) {
         const Vector3 X(dist(g), dist(g), dist(g));
         const auto N = normalize(X);
         CATCH_REQUIRE(N.norm() == Approx(1.0));
         CATCH_REQUIRE(N.dot(X) == Approx(X.norm()));
      }

      // The zero vector is degenerate, and stays zero
      const auto Z = normalize(Vector3{});
      CATCH_REQUIRE(Z == Vector3(0.0, 0.0, 0.0));
      CATCH_REQUIRE(Z.is_finite());
   }

   CATCH_SECTION("distance-and-midpoint")
   {
      const Vector3 A(1.0, 2.0, 3.0);
      const Vector3 B(4.0, 6.0, 3.0);
      CATCH_REQUIRE(distance(A, B) == Approx(5.0));
      CATCH_REQUIRE(distance(B, A) == Approx(5.0));
      CATCH_REQUIRE(midpoint(A, B) == Vector3(2.5, 4.0, 3.0));
      CATCH_REQUIRE(Vector3(A.to_eigen()) == A);
   }

   CATCH_SECTION("overlap-1d")
   {
      const Line1D A(0.0, 5.0);
      const Line1D B(3.0, 10.0);
      CATCH_REQUIRE(overlap_1d(A, B) == Line1D(3.0, 5.0));
      CATCH_REQUIRE(overlap_1d(B, A).length() == 2.0);

      // Disjoint intervals overlap by a negative amount
      const Line1D C(7.0, 9.0);
      CATCH_REQUIRE(overlap_1d(A, C).length() == -2.0);
      CATCH_REQUIRE(overlap_1d(A, C).empty());
   }
}

} // namespace spindle
