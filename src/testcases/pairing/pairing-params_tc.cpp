
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/pairing/pairing-params.hpp"

namespace spindle
{
CATCH_TEST_CASE("PairingParams", "[pairing-params]")
{
   CATCH_SECTION("pairing-params-defaults")
   {
      PairingParams p;
      CATCH_REQUIRE(p.max_dist == 11.0);
      CATCH_REQUIRE(p.min_dist == 4.0);
      CATCH_REQUIRE(p.max_cong_dist == 4.0);
      CATCH_REQUIRE(p.min_overlap == 10.0);
      CATCH_REQUIRE(p.frame_rate == 1.0);
      CATCH_REQUIRE(!p.parallel);
      CATCH_REQUIRE(!p.bounds.is_set());
      CATCH_REQUIRE_NOTHROW(p.validate());

      // Unset bounds are written as null
      const auto o = p.to_json();
      CATCH_REQUIRE(o["bounds"]["top"].isNull());
   }

   CATCH_SECTION("pairing-params-validate")
   {
      auto require_bad = [](auto f, const string_view field) {
         PairingParams p;
         f(p);
         try {
            p.validate();
            CATCH_REQUIRE(false);
         } catch(std::runtime_error& e) {
            CATCH_REQUIRE(string(e.what()).find(field) != string::npos);
         }
      };

      require_bad([](auto& p) { p.min_overlap = 0.0; }, "min_overlap");
      require_bad([](auto& p) { p.min_overlap = -1.0; }, "min_overlap");
      require_bad([](auto& p) { p.max_dist = 0.0; }, "max_dist");
      require_bad([](auto& p) { p.min_dist = -0.1; }, "min_dist");
      require_bad([](auto& p) { p.max_cong_dist = 0.0; }, "max_cong_dist");
      require_bad([](auto& p) { p.frame_rate = 0.0; }, "frame_rate");
      require_bad([](auto& p) { p.max_dist = dNAN; }, "max_dist");

      PairingParams p;
      p.min_dist = 0.0; // allowed
      CATCH_REQUIRE_NOTHROW(p.validate());
   }

   CATCH_SECTION("valid-bounds")
   {
      const ValidBounds b(10.0, 90.0, 20.0, 70.0);
      CATCH_REQUIRE(b.is_set());
      CATCH_REQUIRE(b.is_valid());
      CATCH_REQUIRE(b.distance_to_border(40.0, 50.0) == 20.0);
      CATCH_REQUIRE(b.distance_to_border(40.0, 12.0) == 2.0);
      CATCH_REQUIRE(b.distance_to_border(69.0, 50.0) == 1.0);
      CATCH_REQUIRE(b.distance_to_border(20.0, 50.0) == 0.0);
      CATCH_REQUIRE(b.distance_to_border(40.0, 95.0) == -5.0);

      const auto s = b.scaled(0.5);
      CATCH_REQUIRE(s.top == 5.0);
      CATCH_REQUIRE(s.right == 35.0);

      CATCH_REQUIRE(!ValidBounds{}.is_set());
      CATCH_REQUIRE(!ValidBounds(5.0, 1.0, 0.0, 1.0).is_valid());
   }
}

} // namespace spindle
