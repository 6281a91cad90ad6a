
#pragma once

#include "distance-tracker.hpp"
#include "pairing-params.hpp"

#include "json/json.h"

namespace spindle
{
// A candidate spindle: two tracks (id_i < id_j) that stay close enough,
// for long enough, to be handed to the classifier.
struct Cell
{
   int id_i       = -1;
   int id_j       = -1;
   real t_overlap = 0.0; // min(stop_i, stop_j) - max(start_i, start_j)

   real sl_i   = 0.0; // distance at the first sample
   real sl_f   = 0.0; // distance at the last sample
   real sl_min = 0.0;
   real sl_max = 0.0;

   Vector3 center;          // mean of the midpoints
   real center_stdev = 0.0; // root sum of squares of per-axis sample stdev
   real normal_stdev = 0.0; // as above, over the unit normals
   real t_cong       = 0.0; // congression run length, times frame_rate

   // Means of the two parent tracks
   real contrast  = 0.0;
   real intensity = 0.0;
   real diameter  = 0.0;

   real dist2border = 0.0;

   bool operator==(const Cell& o) const noexcept;
   bool operator!=(const Cell& o) const noexcept { return !(*this == o); }

   string to_string() const noexcept;
   Json::Value to_json() const noexcept;

   friend string str(const Cell& o) { return o.to_string(); }
};

// 'series' must have at least two samples
Cell make_cell(const Track& tt_i,
               const Track& tt_j,
               const PairSeries& series,
               const ValidBounds& bounds,
               const PairingParams& params) noexcept(false);

// Root sum of squares of the per-axis sample standard deviations (N - 1).
// NAN if there are fewer than two points.
real spread_stdev(const vector<Vector3>& Xs) noexcept;

} // namespace spindle
