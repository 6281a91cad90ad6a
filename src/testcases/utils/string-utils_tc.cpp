
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/foundation.hpp"
#include "spindle/utils/string-utils.hpp"

namespace spindle
{
CATCH_TEST_CASE("StringUtils", "[string-utils]")
{
   CATCH_SECTION("lexical-cast")
   {
      int i = 0;
      CATCH_REQUIRE(!lexical_cast("42", i));
      CATCH_REQUIRE(i == 42);
      CATCH_REQUIRE(lexical_cast("42x", i));
      CATCH_REQUIRE(lexical_cast("", i));
      CATCH_REQUIRE(lexical_cast("4.5", i));

      double d = 0.0;
      CATCH_REQUIRE(!lexical_cast("-1.25e2", d));
      CATCH_REQUIRE(d == -125.0);
      CATCH_REQUIRE(lexical_cast("1.0.0", d));
   }

   CATCH_SECTION("explode")
   {
      CATCH_REQUIRE(explode("", ",").empty());
      CATCH_REQUIRE(explode("a,b,,c", ",") == vector<string>{"a", "b", "", "c"});
      CATCH_REQUIRE(explode("a,b,,c", ",", true)
                    == vector<string>{"a", "b", "c"});
      CATCH_REQUIRE(explode(",a", ",") == vector<string>{"", "a"});
      CATCH_REQUIRE(explode("a b\tc", " \t") == vector<string>{"a", "b", "c"});
   }

   CATCH_SECTION("str-replace-and-trim")
   {
      CATCH_REQUIRE(str_replace("-", "_", "pair-tracks") == "pair_tracks");
      CATCH_REQUIRE(str_replace("ab", "x", "abcabab") == "xcxx");
      CATCH_REQUIRE(str_replace("", "x", "abc") == "abc");
      CATCH_REQUIRE(trim_copy("  \t centID_i \r") == "centID_i");

      const vector<int> xs{1, 2, 3};
      CATCH_REQUIRE(implode(cbegin(xs), cend(xs), ", ") == "1, 2, 3");
      CATCH_REQUIRE(begins_with(string("Cent_1a"), string("Cent_")));
      CATCH_REQUIRE(ends_with(string("movie.tif"), string(".tif")));
   }
}

} // namespace spindle
