
#pragma once

#include "spindle/foundation.hpp"

namespace spindle
{
// Length of the longest run of samples where consecutive 'times' differ by
// exactly one, and every distance is below 'threshold'. A gap in 'times', or
// a distance at or above 'threshold', ends the run.
//
// Returns a sample count. Callers scale by the frame duration as needed.
// Throws std::invalid_argument if 'times' and 'distances' differ in size.
int congression_run_length(const vector<int>& times,
                           const vector<real>& distances,
                           const real threshold) noexcept(false);

} // namespace spindle
