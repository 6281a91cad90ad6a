
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/pairing/distance-tracker.hpp"
#include "testcases/test-track-sets.hpp"

static const bool feedback = false;

namespace spindle
{
using namespace spindle::testing;

CATCH_TEST_CASE("TrackPairDistances", "[distance-tracker]")
{
   CATCH_SECTION("distance-tracker-window")
   {
      TestTrack a, b;
      a.id       = 1;
      a.start    = 0.0;
      a.stop     = 10.0;
      a.position = [](int t) { return Vector3(real(t), 0.0, 0.0); };
      b.id       = 2;
      b.start    = 4.0;
      b.stop     = 20.0;
      b.position = [](int t) { return Vector3(real(t), 3.0, 4.0); };

      const auto ts     = make_test_track_set({a, b});
      const auto series = track_pair_distances(ts, 1, 2);
      CATCH_REQUIRE(series.has_value());
      if(feedback) INFO(str(*series));

      // [4, 10)
      CATCH_REQUIRE(series->times == vector<int>{4, 5, 6, 7, 8, 9});
      for(size_t i = 0; i < series->size(); ++i) {
         const auto t = real(series->times[i]);
         CATCH_REQUIRE(series->distances[i] == Approx(5.0));
         CATCH_REQUIRE(series->centers[i].x == Approx(t));
         CATCH_REQUIRE(series->centers[i].y == Approx(1.5));
         CATCH_REQUIRE(series->centers[i].z == Approx(2.0));
         CATCH_REQUIRE(series->normals[i].y == Approx(-0.6));
         CATCH_REQUIRE(series->normals[i].z == Approx(-0.8));
         CATCH_REQUIRE(series->normals[i].norm() == Approx(1.0));
      }

      // Symmetric in distance, opposite in normal
      const auto other = track_pair_distances(ts, 2, 1);
      CATCH_REQUIRE(other.has_value());
      CATCH_REQUIRE(other->distances == series->distances);
      CATCH_REQUIRE(other->normals[0].y == Approx(0.6));
   }

   CATCH_SECTION("distance-tracker-gaps")
   {
      TestTrack a, b;
      a.id    = 1;
      a.start = 0.0;
      a.stop  = 10.0;
      a.gaps  = {2, 5};
      b.id    = 2;
      b.start = 0.0;
      b.stop  = 10.0;
      b.gaps  = {5, 7};

      const auto ts     = make_test_track_set({a, b});
      const auto series = track_pair_distances(ts, 1, 2);
      CATCH_REQUIRE(series.has_value());
      CATCH_REQUIRE(series->times == vector<int>{0, 1, 3, 4, 6, 8, 9});
      CATCH_REQUIRE(series->distances.size() == series->size());
      CATCH_REQUIRE(series->centers.size() == series->size());
      CATCH_REQUIRE(series->normals.size() == series->size());

      // Coincident spots give the zero normal
      for(const auto& n : series->normals) CATCH_REQUIRE(n == Vector3{});
   }

   CATCH_SECTION("distance-tracker-no-overlap")
   {
      TestTrack a, b;
      a.id    = 1;
      a.start = 0.0;
      a.stop  = 5.0;
      b.id    = 2;
      b.start = 5.0;
      b.stop  = 9.0;

      const auto ts = make_test_track_set({a, b});
      CATCH_REQUIRE(!track_pair_distances(ts, 1, 2).has_value());
      CATCH_REQUIRE_THROWS_AS(track_pair_distances(ts, 1, 3),
                              std::runtime_error);
   }

   CATCH_SECTION("distance-tracker-overlap-without-samples")
   {
      // Overlap of [3, 5), but 'b' has no detections there
      TestTrack a, b;
      a.id    = 1;
      a.start = 0.0;
      a.stop  = 5.0;
      b.id    = 2;
      b.start = 3.0;
      b.stop  = 9.0;
      b.gaps  = {3, 4};

      const auto ts     = make_test_track_set({a, b});
      const auto series = track_pair_distances(ts, 1, 2);
      CATCH_REQUIRE(series.has_value());
      CATCH_REQUIRE(series->empty());
   }
}

} // namespace spindle
