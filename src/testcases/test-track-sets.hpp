
#pragma once

#include "spindle/pairing/pairing-params.hpp"
#include "spindle/tracks/track-set.hpp"

namespace spindle::testing
{
// A synthetic track. One spot per integer frame in [start, stop], linked by
// edges. Frames listed in 'gaps' have a spot, but no outgoing edge, so the
// track has no detection there.
struct TestTrack
{
   int id     = -1;
   real start = 0.0;
   real stop  = 0.0;
   Vector3 mean; // used by the border filter
   std::function<Vector3(int t)> position = [](int) { return Vector3{}; };
   vector<int> gaps;

   real diameter  = 1.0;
   real intensity = 100.0;
   real contrast  = 0.5;
};

inline TrackSet make_test_track_set(const vector<TestTrack>& descs)
{
   vector<Spot> spots;
   vector<Track> tracks;
   vector<Edge> edges;

   int spot_id = 0;
   for(const auto& desc : descs) {
      Track tt;
      tt.id       = desc.id;
      tt.position = desc.mean;
      tt.start    = desc.start;
      tt.stop     = desc.stop;
      tt.duration = desc.stop - desc.start;
      tracks.push_back(tt);

      const int t0 = int(std::ceil(desc.start));
      const int t1 = int(std::floor(desc.stop));
      for(int t = t0; t <= t1; ++t) {
         Spot s;
         s.id            = spot_id++;
         s.t             = real(t);
         s.position      = desc.position(t);
         s.diameter      = desc.diameter;
         s.max_intensity = desc.intensity;
         s.contrast      = desc.contrast;
         spots.push_back(s);

         const bool is_gap
             = std::find(cbegin(desc.gaps), cend(desc.gaps), t)
               != cend(desc.gaps);
         if(t < t1 and !is_gap)
            edges.push_back({s.id, s.id + 1, tt.id, real(t)});
      }
   }

   return TrackSet::make(spots, tracks, edges);
}

// Two tracks that sit 'dist' apart along the x axis, around (50, 50, 0)
inline vector<TestTrack> make_test_pair(int id_a,
                                        int id_b,
                                        real start,
                                        real stop,
                                        real dist)
{
   TestTrack a, b;
   a.id = id_a;
   b.id = id_b;
   a.start = b.start = start;
   a.stop = b.stop = stop;
   const auto pa = Vector3{50.0 - 0.5 * dist, 50.0, 0.0};
   const auto pb = Vector3{50.0 + 0.5 * dist, 50.0, 0.0};
   a.mean        = pa;
   b.mean        = pb;
   a.position    = [pa](int) { return pa; };
   b.position    = [pb](int) { return pb; };
   return {a, b};
}

inline ValidBounds test_bounds() { return ValidBounds(0.0, 100.0, 0.0, 100.0); }

} // namespace spindle::testing
