
#include <algorithm>
#include <atomic>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/foundation.hpp"

namespace spindle
{
CATCH_TEST_CASE("ParallelJobSet", "[threads]")
{
   CATCH_SECTION("parallel-job-set-runs-every-job")
   {
      for(const bool parallel : {false, true}) {
         vector<int> slots(100, 0);
         ParallelJobSet pjobs;
         pjobs.set_max_threads(4);
         for(size_t i = 0; i < slots.size(); ++i)
            pjobs.schedule([&slots, i]() { slots[i] = int(i) * 2; });
         CATCH_REQUIRE(pjobs.size() == slots.size());

         if(parallel)
            pjobs.execute();
         else
            pjobs.execute_non_parallel();

         for(size_t i = 0; i < slots.size(); ++i)
            CATCH_REQUIRE(slots[i] == int(i) * 2);
      }
   }

   CATCH_SECTION("parallel-job-set-rethrows")
   {
      std::atomic<int> counter{0};
      ParallelJobSet pjobs;
      for(auto i = 0; i < 20; ++i)
         pjobs.schedule([&counter, i]() {
            ++counter;
            if(i == 7) throw std::runtime_error("job 7 failed");
         });

      CATCH_REQUIRE_THROWS_AS(pjobs.execute(), std::runtime_error);
      CATCH_REQUIRE(counter.load() == 20); // every job still ran
   }
}

} // namespace spindle
