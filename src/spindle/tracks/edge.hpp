
#pragma once

#include "spindle/foundation.hpp"

#include "json/json.h"

namespace spindle
{
// A tracking-tool link between two spots of the same track
struct Edge
{
   int source   = -1; // spot id
   int target   = -1; // spot id
   int track_id = -1;
   real t       = 0.0; // truncated to an integer frame when indexed

   int frame() const noexcept { return int(t); }

   bool operator==(const Edge& o) const noexcept;
   bool operator!=(const Edge& o) const noexcept { return !(*this == o); }

   string to_string() const noexcept;
   Json::Value to_json() const noexcept;
   void read(const Json::Value& o) noexcept(false);

   friend string str(const Edge& o) { return o.to_string(); }
};

} // namespace spindle
