
#include "spot.hpp"

#include "spindle/io/json-io.hpp"
#include "spindle/utils/math.hpp"

namespace spindle
{
// ------------------------------------------------------------------------ Spot

bool Spot::operator==(const Spot& o) const noexcept
{
   return id == o.id and float_is_same(t, o.t) and position == o.position
          and float_is_same(diameter, o.diameter)
          and float_is_same(max_intensity, o.max_intensity)
          and float_is_same(contrast, o.contrast);
}

string Spot::to_string() const noexcept
{
   return format("spot #{} t={} {}, diameter={}, max-intensity={}, "
                 "contrast={}",
                 id,
                 t,
                 str(position),
                 diameter,
                 max_intensity,
                 contrast);
}

Json::Value Spot::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["id"]            = id;
   o["t"]             = json_save(t);
   o["x"]             = json_save(position.x);
   o["y"]             = json_save(position.y);
   o["z"]             = json_save(position.z);
   o["diameter"]      = json_save(diameter);
   o["max_intensity"] = json_save(max_intensity);
   o["contrast"]      = json_save(contrast);
   return o;
}

void Spot::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading spot"s;
   Spot x;
   x.id            = json_load_key<int>(o, "id", op);
   x.t             = json_load_key_w_default<real>(o, "t", 0.0, op);
   x.position.x    = json_load_key<real>(o, "x", op);
   x.position.y    = json_load_key<real>(o, "y", op);
   x.position.z    = json_load_key<real>(o, "z", op);
   x.diameter      = json_load_key<real>(o, "diameter", op);
   x.max_intensity = json_load_key<real>(o, "max_intensity", op);
   x.contrast      = json_load_key<real>(o, "contrast", op);

   auto check_finite = [&](const char* key, real value) {
      if(!std::isfinite(value))
         throw std::runtime_error(
             format("spot {} has a non-finite '{}'", x.id, key));
   };
   check_finite("x", x.position.x);
   check_finite("y", x.position.y);
   check_finite("z", x.position.z);
   check_finite("diameter", x.diameter);
   check_finite("max_intensity", x.max_intensity);
   check_finite("contrast", x.contrast);

   *this = x;
}

} // namespace spindle
