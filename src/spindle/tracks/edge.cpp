
#include "edge.hpp"

#include "spindle/io/json-io.hpp"
#include "spindle/utils/math.hpp"

namespace spindle
{
bool Edge::operator==(const Edge& o) const noexcept
{
   return source == o.source and target == o.target and track_id == o.track_id
          and float_is_same(t, o.t);
}

string Edge::to_string() const noexcept
{
   return format("edge {} -> {}, track #{}, t={}", source, target, track_id, t);
}

Json::Value Edge::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["source"]   = source;
   o["target"]   = target;
   o["track_id"] = track_id;
   o["t"]        = json_save(t);
   return o;
}

void Edge::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading edge"s;
   Edge x;
   x.source   = json_load_key<int>(o, "source", op);
   x.target   = json_load_key<int>(o, "target", op);
   x.track_id = json_load_key<int>(o, "track_id", op);
   x.t        = json_load_key<real>(o, "t", op);
   if(!std::isfinite(x.t))
      throw std::runtime_error(format("edge {} -> {} has a non-finite time",
                                      x.source,
                                      x.target));
   *this = x;
}

} // namespace spindle
