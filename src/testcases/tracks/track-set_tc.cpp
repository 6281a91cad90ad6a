
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/io/json-io.hpp"
#include "spindle/tracks/track-set.hpp"
#include "spindle/utils/file-system.hpp"

static const bool feedback = false;

namespace spindle
{
static const string k_track_set_json = R"V0G0N(
{
   "spots": [
      {"id": 10, "t": 0, "x": 1.0, "y": 2.0, "z": 0.5, "diameter": 1.0, "max_intensity": 100, "contrast": 0.2},
      {"id": 11, "t": 1, "x": 1.5, "y": 2.0, "z": 0.5, "diameter": 2.0, "max_intensity": 200, "contrast": 0.4},
      {"id": 12, "t": 2, "x": 2.0, "y": 2.0, "z": 0.5, "diameter": 3.0, "max_intensity": 300, "contrast": 0.6},
      {"id": 20, "t": 1, "x": 9.0, "y": 9.0, "z": 1.0, "diameter": 5.0, "max_intensity": 50, "contrast": 0.1}
   ],
   "tracks": [
      {"id": 1, "x": 1.5, "y": 2.0, "z": 0.5, "start": 0.0, "stop": 2.0},
      {"id": 2, "x": 9.0, "y": 9.0, "z": 1.0, "start": 1.0, "stop": 3.0, "duration": 2.0},
      {"id": 3, "x": 5.0, "y": 5.0, "z": 0.0, "start": 4.0, "stop": 6.0}
   ],
   "edges": [
      {"source": 10, "target": 11, "track_id": 1, "t": 0.0},
      {"source": 11, "target": 12, "track_id": 1, "t": 1.0},
      {"source": 20, "target": 21, "track_id": 2, "t": 1.7}
   ]
}
)V0G0N";

CATCH_TEST_CASE("TrackSet", "[track-set]")
{
   CATCH_SECTION("track-set-read")
   {
      const auto ts = read_track_set(parse_json(k_track_set_json));
      if(feedback) INFO(ts.brief_info());

      CATCH_REQUIRE(ts.n_spots() == 4);
      CATCH_REQUIRE(ts.n_tracks() == 3);
      CATCH_REQUIRE(ts.n_edges() == 3);

      const Track* tt = ts.track(1);
      CATCH_REQUIRE(tt != nullptr);
      CATCH_REQUIRE(tt->duration == 2.0); // stop - start
      CATCH_REQUIRE(tt->time_range().length() == 2.0);

      // Frames 0 and 1 (the last spot is only ever a target)
      CATCH_REQUIRE(ts.spot_at(1, 0)->id == 10);
      CATCH_REQUIRE(ts.spot_at(1, 1)->id == 11);
      CATCH_REQUIRE(ts.spot_at(1, 2) == nullptr);
      CATCH_REQUIRE(ts.spot_at(1, -1) == nullptr);
      CATCH_REQUIRE(ts.spot_at(99, 0) == nullptr);

      // Edge times are truncated
      CATCH_REQUIRE(ts.spot_at(2, 1)->id == 20);

      // Photometrics average the visited spots
      CATCH_REQUIRE(tt->diameter == Approx(1.5));
      CATCH_REQUIRE(tt->intensity == Approx(150.0));
      CATCH_REQUIRE(tt->contrast == Approx(0.3));

      // A track without spots
      CATCH_REQUIRE(ts.time_map(3) != nullptr);
      CATCH_REQUIRE(ts.time_map(3)->empty());
      CATCH_REQUIRE(ts.track(3)->diameter == 0.0);
      CATCH_REQUIRE(ts.track(3)->intensity == 0.0);
      CATCH_REQUIRE(ts.track(3)->contrast == 0.0);
   }

   CATCH_SECTION("track-set-save-load")
   {
      const auto ts  = read_track_set(parse_json(k_track_set_json));
      const auto dir = make_temp_directory("/tmp/track-set-tc.XXXXXX");
      const auto fname = format("{}/track-set.json", dir);

      save_track_set(ts, fname);
      const auto ts2 = load_track_set(fname);
      CATCH_REQUIRE(ts2.n_spots() == ts.n_spots());
      CATCH_REQUIRE(ts2.sorted_spots() == ts.sorted_spots());
      CATCH_REQUIRE(ts2.edges() == ts.edges());
      for(const auto& [id, tt] : ts.tracks())
         CATCH_REQUIRE(*ts2.track(id) == tt);

      remove_all(dir);

      CATCH_REQUIRE_THROWS_AS(load_track_set(fname), std::runtime_error);
   }

   CATCH_SECTION("track-set-errors")
   {
      auto bad = [](auto f) {
         auto o = parse_json(k_track_set_json);
         f(o);
         return o;
      };

      CATCH_REQUIRE_THROWS_AS(read_track_set(bad([](auto& o) {
                                 o.removeMember("edges");
                              })),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read_track_set(bad([](auto& o) {
                                 o["spots"][0].removeMember("contrast");
                              })),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read_track_set(bad([](auto& o) {
                                 o["spots"][1]["id"] = 10; // duplicate
                              })),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read_track_set(bad([](auto& o) {
                                 o["edges"][0]["track_id"] = 7;
                              })),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read_track_set(bad([](auto& o) {
                                 o["edges"][0]["source"] = 77;
                              })),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read_track_set(bad([](auto& o) {
                                 o["tracks"][0]["start"] = 5.0;
                              })),
                              std::runtime_error);
   }

   CATCH_SECTION("track-set-non-finite-spots")
   {
      // 'null' reads as NAN, which a spot must never carry
      for(const char* key :
          {"x", "y", "z", "diameter", "max_intensity", "contrast"}) {
         auto o             = parse_json(k_track_set_json);
         o["spots"][2][key] = Json::Value{Json::nullValue};
         CATCH_REQUIRE_THROWS_WITH(
             read_track_set(o),
             Catch::Matchers::Contains(format("spot 12 has a non-finite '{}'",
                                              key)));
      }

      // The informational time may still be missing
      auto o = parse_json(k_track_set_json);
      o["spots"][2].removeMember("t");
      CATCH_REQUIRE(read_track_set(o).n_spots() == 4);
   }

   CATCH_SECTION("track-set-later-edges-win")
   {
      Spot a, b;
      a.id = 1;
      b.id = 2;
      Track tt;
      tt.id   = 5;
      tt.stop = 3.0;
      const auto ts = TrackSet::make(
          {a, b}, {tt}, {Edge{1, 2, 5, 1.2}, Edge{2, 1, 5, 1.9}});
      CATCH_REQUIRE(ts.spot_at(5, 1)->id == 2);
   }
}

} // namespace spindle
