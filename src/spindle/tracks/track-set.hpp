
#pragma once

#include "edge.hpp"
#include "spot.hpp"
#include "track.hpp"

namespace spindle
{
// Immutable arena of spots and tracks, with a per-track frame index.
// Built once by 'make', then only read (and safe to read from many threads).
class TrackSet
{
 public:
   using TimeMap = std::map<int, int>; // integer frame -> spot id

 private:
   hashmap<int, Spot> spots_;
   std::map<int, Track> tracks_; // ordered by id
   hashmap<int, TimeMap> time_maps_;
   vector<Edge> edges_;

 public:
   // Builds the time maps, and the photometric summaries of every track.
   // Throws if ids are duplicated, or an edge refers to an unknown spot/track.
   static TrackSet make(const vector<Spot>& spots,
                        const vector<Track>& tracks,
                        const vector<Edge>& edges) noexcept(false);

   size_t n_spots() const noexcept { return spots_.size(); }
   size_t n_tracks() const noexcept { return tracks_.size(); }
   size_t n_edges() const noexcept { return edges_.size(); }

   const std::map<int, Track>& tracks() const noexcept { return tracks_; }
   const vector<Edge>& edges() const noexcept { return edges_; }

   // nullptr if not found
   const Spot* spot(int spot_id) const noexcept;
   const Track* track(int track_id) const noexcept;
   const TimeMap* time_map(int track_id) const noexcept;

   // The spot occupied by 'track_id' at frame 't', nullptr if there is none
   const Spot* spot_at(int track_id, int t) const noexcept;

   vector<Spot> sorted_spots() const noexcept; // by id

   string brief_info() const noexcept;
   Json::Value to_json() const noexcept;
};

TrackSet read_track_set(const Json::Value& o) noexcept(false);
TrackSet load_track_set(const string_view fname) noexcept(false);
void save_track_set(const TrackSet& track_set,
                    const string_view fname) noexcept(false);

} // namespace spindle
