
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/pairing/feature-table.hpp"

static const bool feedback = false;

namespace spindle
{
static Cell make_test_cell(int id_i, int id_j, real contrast, real intensity)
{
   Cell c;
   c.id_i      = id_i;
   c.id_j      = id_j;
   c.t_overlap = 12.0;
   c.sl_i      = 3.0;
   c.sl_f      = 2.0;
   c.sl_min    = 1.5;
   c.sl_max    = 3.5;
   c.t_cong    = 4.0;
   c.contrast  = contrast;
   c.intensity = intensity;
   c.diameter  = 0.7;
   return c;
}

CATCH_TEST_CASE("FeatureTable", "[feature-table]")
{
   CATCH_SECTION("min-max-normalize")
   {
      vector<real> X{4.0, 2.0, 8.0, 5.0};
      min_max_normalize(X);
      CATCH_REQUIRE(X[0] == Approx(1.0 / 3.0));
      CATCH_REQUIRE(X[1] == Approx(0.0));
      CATCH_REQUIRE(X[2] == Approx(1.0));
      CATCH_REQUIRE(X[3] == Approx(0.5));

      vector<real> one{42.0};
      min_max_normalize(one);
      CATCH_REQUIRE(one[0] == 0.0);

      vector<real> flat{3.0, 3.0, 3.0};
      min_max_normalize(flat);
      CATCH_REQUIRE(flat == vector<real>{0.0, 0.0, 0.0});

      vector<real> none;
      min_max_normalize(none);
      CATCH_REQUIRE(none.empty());
   }

   CATCH_SECTION("feature-table-rows")
   {
      const vector<Cell> cells{make_test_cell(3, 9, 0.2, 150.0),
                               make_test_cell(1, 4, 0.6, 100.0),
                               make_test_cell(2, 7, 0.4, 200.0)};
      const auto table = make_feature_table(cells);
      CATCH_REQUIRE(table.size() == 3);

      // Row order matches the input
      CATCH_REQUIRE(table.rows[0].centID_i == 3);
      CATCH_REQUIRE(table.rows[1].centID_i == 1);
      CATCH_REQUIRE(table.rows[2].centID_j == 7);

      CATCH_REQUIRE(table.rows[0].contrast == Approx(0.0));
      CATCH_REQUIRE(table.rows[1].contrast == Approx(1.0));
      CATCH_REQUIRE(table.rows[2].contrast == Approx(0.5));
      CATCH_REQUIRE(table.rows[0].intensity == Approx(0.5));
      CATCH_REQUIRE(table.rows[1].intensity == Approx(0.0));
      CATCH_REQUIRE(table.rows[2].intensity == Approx(1.0));

      // Everything else is untouched
      for(const auto& row : table.rows) {
         CATCH_REQUIRE(row.t_overlap == 12.0);
         CATCH_REQUIRE(row.sl_min == 1.5);
         CATCH_REQUIRE(row.diameter == 0.7);
         CATCH_REQUIRE(row.t_cong == 4.0);
      }
   }

   CATCH_SECTION("feature-table-csv")
   {
      CATCH_REQUIRE(make_feature_table({}).empty());
      CATCH_REQUIRE(make_feature_table({}).to_csv()
                    == "centID_i,centID_j,t_overlap,sl_i,sl_f,sl_min,sl_max,"
                       "center_stdev,normal_stdev,t_cong,contrast,intensity,"
                       "diameter\n");

      const auto table = make_feature_table({make_test_cell(1, 2, 0.3, 9.0)});
      const auto csv   = table.to_csv();
      if(feedback) INFO(csv);

      const auto lines = explode(csv, "\n", true);
      CATCH_REQUIRE(lines.size() == 2);
      CATCH_REQUIRE(explode(lines[0], ",").size()
                    == FeatureTable::column_names().size());
      CATCH_REQUIRE(lines[1] == "1,2,12,3,2,1.5,3.5,0,0,4,0,0,0.7");
   }

   CATCH_SECTION("spread-stdev")
   {
      CATCH_REQUIRE(std::isnan(spread_stdev({})));
      CATCH_REQUIRE(std::isnan(spread_stdev({Vector3(1.0, 2.0, 3.0)})));

      // Per-axis sample stdevs of 1, 2, and 0
      const vector<Vector3> Xs{Vector3(1.0, 0.0, 5.0),
                               Vector3(2.0, 2.0, 5.0),
                               Vector3(3.0, 4.0, 5.0)};
      CATCH_REQUIRE(spread_stdev(Xs) == Approx(std::sqrt(1.0 + 4.0)));
   }
}

} // namespace spindle
