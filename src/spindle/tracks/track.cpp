
#include "track.hpp"

#include "spindle/io/json-io.hpp"
#include "spindle/utils/math.hpp"

#define This Track

namespace spindle
{
bool This::operator==(const Track& o) const noexcept
{
   return id == o.id and position == o.position
          and float_is_same(start, o.start) and float_is_same(stop, o.stop)
          and float_is_same(duration, o.duration)
          and float_is_same(diameter, o.diameter)
          and float_is_same(contrast, o.contrast)
          and float_is_same(intensity, o.intensity);
}

string This::brief_info() const noexcept
{
   return format("track #{} {}", id, str(time_range()));
}

string This::to_string() const noexcept
{
   return format(R"V0G0N(
Track #{}
   position:   {}
   time:       {}
   duration:   {}
   diameter:   {}
   contrast:   {}
   intensity:  {}
{})V0G0N",
                 id,
                 str(position),
                 str(time_range()),
                 duration,
                 diameter,
                 contrast,
                 intensity,
                 "");
}

Json::Value This::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["id"]       = id;
   o["x"]        = json_save(position.x);
   o["y"]        = json_save(position.y);
   o["z"]        = json_save(position.z);
   o["start"]    = json_save(start);
   o["stop"]     = json_save(stop);
   o["duration"] = json_save(duration);
   return o;
}

void This::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading track"s;
   Track x;
   x.id         = json_load_key<int>(o, "id", op);
   x.position.x = json_load_key<real>(o, "x", op);
   x.position.y = json_load_key<real>(o, "y", op);
   x.position.z = json_load_key<real>(o, "z", op);
   x.start      = json_load_key<real>(o, "start", op);
   x.stop       = json_load_key<real>(o, "stop", op);
   x.duration
       = json_load_key_w_default<real>(o, "duration", x.stop - x.start, op);

   if(!std::isfinite(x.start) or !std::isfinite(x.stop))
      throw std::runtime_error(
          format("track #{} has a non-finite start or stop", x.id));
   if(x.start > x.stop)
      throw std::runtime_error(format(
          "track #{} starts ({}) after it stops ({})", x.id, x.start, x.stop));

   *this = x;
}

} // namespace spindle
