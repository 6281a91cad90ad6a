
#include "congression.hpp"

#include <stdexcept>

namespace spindle
{
int congression_run_length(const vector<int>& times,
                           const vector<real>& distances,
                           const real threshold) noexcept(false)
{
   if(times.size() != distances.size())
      throw std::invalid_argument(
          format("congression: {} times, but {} distances",
                 times.size(),
                 distances.size()));

   int best    = 0;
   int counter = 0;
   for(size_t i = 0; i < times.size(); ++i) {
      const bool continuous = (i > 0) and (times[i - 1] + 1 == times[i]);
      if(!continuous) counter = 0;
      if(distances[i] < threshold)
         ++counter;
      else
         counter = 0;
      best = std::max(best, counter);
   }

   return best;
}

} // namespace spindle
