
#include <algorithm>
#include <iterator>
#include <random>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/pairing/congression.hpp"

static const bool feedback = false;

namespace spindle
{
static vector<int> make_times(int t0, size_t n)
{
   vector<int> o(n);
   std::iota(begin(o), end(o), t0);
   return o;
}

CATCH_TEST_CASE("CongressionRunLength", "[congression]")
{
   CATCH_SECTION("congression-excursion")
   {
      const vector<real> D{3, 3, 2, 2, 6, 6, 2, 2, 2, 2, 2};
      const auto T = make_times(10, D.size());
      const auto n = congression_run_length(T, D, 4.0);
      if(feedback) INFO(format("congression = {}", n));
      CATCH_REQUIRE(n == 5); // the trailing run, never the merged 9
   }

   CATCH_SECTION("congression-degenerate")
   {
      CATCH_REQUIRE(congression_run_length({}, {}, 4.0) == 0);
      CATCH_REQUIRE(congression_run_length({7}, {1.0}, 4.0) == 1);
      CATCH_REQUIRE(congression_run_length({7}, {5.0}, 4.0) == 0);
      CATCH_REQUIRE(congression_run_length({7}, {4.0}, 4.0) == 0); // strict

      const vector<real> D(10, 9.0);
      CATCH_REQUIRE(congression_run_length(make_times(0, D.size()), D, 4.0)
                    == 0);

      CATCH_REQUIRE_THROWS_AS(congression_run_length({1, 2}, {1.0}, 4.0),
                              std::invalid_argument);
   }

   CATCH_SECTION("congression-gaps")
   {
      // A gap ends a run, even when both sides are close
      const vector<int> T{1, 2, 3, 5, 6};
      const vector<real> D{1, 1, 1, 1, 1};
      CATCH_REQUIRE(congression_run_length(T, D, 4.0) == 3);

      const vector<int> U{1, 3, 5, 7};
      const vector<real> E{1, 1, 1, 1};
      CATCH_REQUIRE(congression_run_length(U, E, 4.0) == 1);
   }

   CATCH_SECTION("congression-split-is-max-not-sum")
   {
      std::mt19937 g;
      g.seed(0);

      for(auto trial = 0; trial < 100; ++trial) {
         const size_t n = 4 + size_t(g() % 20);
         vector<real> D(n);
         for(auto& d : D) d = real(g() % 300) / 100.0; // [0, 3)
         const auto T = make_times(100, n);
         CATCH_REQUIRE(congression_run_length(T, D, 4.0) == int(n));

         // Break the run at 'k'
         const size_t k = 1 + size_t(g() % (n - 2));
         D[k]           = 4.0 + real(g() % 100);
         const int a    = int(k);
         const int b    = int(n - k - 1);
         CATCH_REQUIRE(congression_run_length(T, D, 4.0) == std::max(a, b));
      }
   }
}

} // namespace spindle
