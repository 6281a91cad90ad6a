
#pragma once

#include "spindle/geometry/line-1d.hpp"
#include "spindle/geometry/vector-3.hpp"

#include "json/json.h"

namespace spindle
{
struct Track
{
   int id = -1;
   Vector3 position; // Mean position of the track, used in border testing
   real start    = 0.0;
   real stop     = 0.0;
   real duration = 0.0;

   // Averages over the spots visited, computed when the TrackSet is built
   real diameter  = 0.0;
   real contrast  = 0.0;
   real intensity = 0.0; // mean of the spots' max-intensity

   bool operator==(const Track& o) const noexcept;
   bool operator!=(const Track& o) const noexcept { return !(*this == o); }

   // [start, stop)
   Line1D time_range() const noexcept { return Line1D(start, stop); }

   // Integer frames 'ceil(start)' onwards
   int first_frame() const noexcept { return int(std::ceil(start)); }

   string brief_info() const noexcept;
   string to_string() const noexcept;
   Json::Value to_json() const noexcept;
   void read(const Json::Value& o) noexcept(false);

   friend string str(const Track& o) { return o.to_string(); }
};

} // namespace spindle
