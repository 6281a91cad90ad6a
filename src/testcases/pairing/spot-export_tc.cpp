
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/pairing/spot-export.hpp"
#include "testcases/test-track-sets.hpp"

static const bool feedback = false;

namespace spindle
{
using namespace spindle::testing;

CATCH_TEST_CASE("SpotExport", "[spot-export]")
{
   CATCH_SECTION("read-accepted-pairs")
   {
      const auto pairs = read_accepted_pairs(R"V0G0N(
,centID_i,centID_j,t_overlap,Predicted_Label
0,1,2,20.0,1
1,3,4,20.0,0
2,2,1,20.0,1
3,5.0,6.0,11.0,1.0
4,1,2,20.0,1
)V0G0N");

      CATCH_REQUIRE(pairs.size() == 2);
      CATCH_REQUIRE(pairs[0] == TrackPair{1, 2});
      CATCH_REQUIRE(pairs[1] == TrackPair{5, 6});

      CATCH_REQUIRE(read_accepted_pairs("centID_i,centID_j,Predicted_Label\r\n")
                        .empty());
      CATCH_REQUIRE_THROWS_AS(read_accepted_pairs(""), std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read_accepted_pairs("centID_i,Predicted_Label\n"),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(
          read_accepted_pairs("centID_i,centID_j,Predicted_Label\n1,x,1\n"),
          std::runtime_error);

      // Ids must be integers that fit an 'int'
      CATCH_REQUIRE_THROWS_AS(
          read_accepted_pairs("centID_i,centID_j,Predicted_Label\n1e20,2,1\n"),
          std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(
          read_accepted_pairs("centID_i,centID_j,Predicted_Label\n1,-3e9,1\n"),
          std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(
          read_accepted_pairs("centID_i,centID_j,Predicted_Label\n1.5,2,1\n"),
          std::runtime_error);

      // Rows not labelled 1 are never range checked
      CATCH_REQUIRE(
          read_accepted_pairs("centID_i,centID_j,Predicted_Label\n1e20,2,0\n")
              .empty());
   }

   CATCH_SECTION("spot-export")
   {
      auto descs = make_test_pair(1, 2, 0.0, 4.0, 2.0);
      descs[1].gaps = {2};
      const auto ts = make_test_track_set(descs);

      // Frames [0, 4)
      CATCH_REQUIRE(link_track_spots(ts, 1).size() == 4);
      CATCH_REQUIRE(link_track_spots(ts, 2).size() == 3);
      CATCH_REQUIRE_THROWS_AS(link_track_spots(ts, 3), std::runtime_error);

      const auto out = make_spot_export(ts, {TrackPair{1, 2}});
      CATCH_REQUIRE(out.rows.size() == 7);
      CATCH_REQUIRE(out.rows.front().label == "Cent_1a");
      CATCH_REQUIRE(out.rows.front().track_id == 1);
      CATCH_REQUIRE(out.rows.back().label == "Cent_1b");
      CATCH_REQUIRE(out.rows.back().track_id == 2);

      const auto csv = out.to_csv();
      if(feedback) INFO(csv);
      const auto lines = explode(csv, "\n", true);
      CATCH_REQUIRE(lines.size() == 8);
      CATCH_REQUIRE(lines[0]
                    == "Label,ID,TRACK_ID,POSITION_X,POSITION_Y,POSITION_Z,"
                       "POSITION_T,ESTIMATED_DIAMETER,MAX_INTENSITY,CONTRAST");
      CATCH_REQUIRE(begins_with(lines[1], string("Cent_1a,0,1,49,50,0,0,")));

      CATCH_REQUIRE_THROWS_AS(make_spot_export(ts, {TrackPair{1, 9}}),
                              std::runtime_error);
   }

   CATCH_SECTION("cell-coords")
   {
      auto descs    = make_test_pair(1, 2, 0.0, 4.0, 2.0);
      descs[1].gaps = {2};
      auto later    = make_test_pair(3, 4, 2.0, 6.0, 4.0);
      later[1].start = 10.0; // disjoint in time from track 3
      later[1].stop  = 12.0;
      descs.insert(end(descs), cbegin(later), cend(later));
      const auto ts = make_test_track_set(descs);

      const auto coords
          = make_cell_coords(ts, {TrackPair{3, 4}, TrackPair{1, 2}});

      // Frame 2 is missing from track 2
      CATCH_REQUIRE(coords.rows.size() == 3);
      const vector<int> frames{0, 1, 3};
      for(size_t i = 0; i < coords.rows.size(); ++i) {
         CATCH_REQUIRE(coords.rows[i].cell == "Cell_2");
         CATCH_REQUIRE(coords.rows[i].frame == frames[i]);
         CATCH_REQUIRE(coords.rows[i].X == Vector3(50.0, 50.0, 0.0));
      }

      CATCH_REQUIRE(coords.cell_ids() == vector<string>{"Cell_2"});
      CATCH_REQUIRE(coords.cell_ids_text() == "Cell_2\n");

      const auto tsv = coords.to_tsv();
      if(feedback) INFO(tsv);
      const auto lines = explode(tsv, "\n", true);
      CATCH_REQUIRE(lines.size() == 4);
      CATCH_REQUIRE(lines[0] == "Cell\tFrame\tX\tY\tZ");
      CATCH_REQUIRE(lines[1] == "Cell_2\t0\t50\t50\t0");
      CATCH_REQUIRE(lines[3] == "Cell_2\t3\t50\t50\t0");

      CATCH_REQUIRE(make_cell_coords(ts, {}).rows.empty());
      CATCH_REQUIRE_THROWS_AS(make_cell_coords(ts, {TrackPair{9, 1}}),
                              std::runtime_error);
   }
}

} // namespace spindle
