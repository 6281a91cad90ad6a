
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/pairing/pairing-params.hpp"

namespace spindle
{
template<typename T> static void test_eq(const T& u, const Json::Value& o)
{
   T v, z;
   v.read_with_defaults(o, &z);
   CATCH_REQUIRE(u == v);
}

template<typename T> static void test_it_eq()
{
   T u;
   Json::Value packed        = u.to_json();
   const vector<string> keys = packed.getMemberNames();
   for(auto i = 0u; i < keys.size(); i += 2) packed.removeMember(keys[i]);
   test_eq<T>(u, packed);
}

template<typename T> static void test_read_eq()
{
   T u, v;
   Json::Value packed        = u.to_json();
   const vector<string> keys = packed.getMemberNames();
   for(auto i = 0u; i < keys.size(); ++i) {
      Json::Value p2 = packed;
      p2.removeMember(keys[i]);
      read(v, p2);
      CATCH_REQUIRE(u == v);
   }
   test_it_eq<T>();
}

CATCH_TEST_CASE("STRUCT-META", "[struct_meta]")
{
   CATCH_SECTION("struct-meta")
   {
      test_read_eq<ValidBounds>();
      test_read_eq<PairingParams>();
   }

   CATCH_SECTION("struct-meta-round-trip")
   {
      PairingParams p, q;
      p.max_dist = 9.5;
      p.parallel = true;
      p.bounds   = ValidBounds(1.0, 90.0, 2.0, 80.0);
      CATCH_REQUIRE(p != q);

      const auto s = p.to_json_string();
      q.read(parse_json(s));
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(q.bounds.right == 80.0);

      // 'parallel' is not important in equality
      q.parallel = false;
      CATCH_REQUIRE(p == q);
   }

   CATCH_SECTION("struct-meta-nested-defaults")
   {
      // Only one member of the nested object is given
      const auto o = parse_json(R"V0G0N(
{
   "min_overlap": 5,
   "bounds": { "top": 3.0 }
}
)V0G0N");

      PairingParams p;
      read(p, o);
      CATCH_REQUIRE(p.min_overlap == 5.0);
      CATCH_REQUIRE(p.max_dist == 11.0);
      CATCH_REQUIRE(p.bounds.top == 3.0);
      CATCH_REQUIRE(std::isnan(p.bounds.bottom));
      CATCH_REQUIRE(!p.bounds.is_set());
   }

   CATCH_SECTION("struct-meta-errors")
   {
      PairingParams p;

      // 'read' requires every key
      CATCH_REQUIRE_THROWS_AS(p.read(parse_json(R"({"max_dist": 3})")),
                              std::runtime_error);

      // Wrong type
      CATCH_REQUIRE_THROWS_AS(read(p, parse_json(R"({"max_dist": "far"})")),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read(p, parse_json(R"({"bounds": 7})")),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(read(p, parse_json("[1, 2, 3]")),
                              std::runtime_error);
   }
}

} // namespace spindle
