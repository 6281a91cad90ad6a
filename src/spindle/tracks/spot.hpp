
#pragma once

#include "spindle/geometry/vector-3.hpp"

#include "json/json.h"

namespace spindle
{
// A single detection at a single frame
struct Spot
{
   int id        = -1;
   real t        = 0.0; // physical time of the frame (informational)
   Vector3 position;    // physical units
   real diameter      = 0.0;
   real max_intensity = 0.0;
   real contrast      = 0.0;

   bool operator==(const Spot& o) const noexcept;
   bool operator!=(const Spot& o) const noexcept { return !(*this == o); }

   string to_string() const noexcept;
   Json::Value to_json() const noexcept;
   void read(const Json::Value& o) noexcept(false);

   friend string str(const Spot& o) { return o.to_string(); }
};

} // namespace spindle
