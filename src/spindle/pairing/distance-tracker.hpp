
#pragma once

#include "spindle/geometry/vector-3.hpp"
#include "spindle/tracks/track-set.hpp"

namespace spindle
{
// Parallel sequences, one entry per frame where both tracks have a spot
struct PairSeries
{
   vector<int> times;
   vector<real> distances;
   vector<Vector3> centers; // midpoint of the two spots
   vector<Vector3> normals; // normalize(p_i - p_j)

   size_t size() const noexcept { return times.size(); }
   bool empty() const noexcept { return times.empty(); }

   void push_back(int t, const Vector3& p_i, const Vector3& p_j) noexcept;

   string to_string() const noexcept;
   friend string str(const PairSeries& o) { return o.to_string(); }
};

// Samples the integer frames in [max(start_i, start_j), min(stop_i, stop_j)),
// skipping frames where either track has no spot.
//
// Returns std::nullopt if the window is empty (no overlap), which is distinct
// from an overlap with no common frames (an empty PairSeries).
// Throws std::runtime_error if either track id is unknown.
std::optional<PairSeries> track_pair_distances(const TrackSet& track_set,
                                               const int id_i,
                                               const int id_j) noexcept(false);

} // namespace spindle
