
#include "pairing-params.hpp"

#include "spindle/utils/math.hpp"

namespace spindle
{
// ----------------------------------------------------------------- ValidBounds

const vector<MemberMetaData>& ValidBounds::meta_data() const noexcept
{
   auto make_meta = [&]() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ValidBounds, REAL, top, true));
      m.push_back(MAKE_META(ValidBounds, REAL, bottom, true));
      m.push_back(MAKE_META(ValidBounds, REAL, left, true));
      m.push_back(MAKE_META(ValidBounds, REAL, right, true));
      return m;
   };
   static vector<MemberMetaData> meta = make_meta();
   return meta;
}

bool ValidBounds::is_set() const noexcept
{
   return std::isfinite(top) and std::isfinite(bottom) and std::isfinite(left)
          and std::isfinite(right);
}

bool ValidBounds::is_valid() const noexcept
{
   return is_set() and (top <= bottom) and (left <= right);
}

real ValidBounds::distance_to_border(real x, real y) const noexcept
{
   return std::min({y - top, bottom - y, x - left, right - x});
}

ValidBounds ValidBounds::scaled(real factor) const noexcept
{
   return ValidBounds(top * factor, bottom * factor, left * factor,
                      right * factor);
}

// --------------------------------------------------------------- PairingParams

const vector<MemberMetaData>& PairingParams::meta_data() const noexcept
{
   auto make_meta = [&]() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(PairingParams, REAL, max_dist, true));
      m.push_back(MAKE_META(PairingParams, REAL, min_dist, true));
      m.push_back(MAKE_META(PairingParams, REAL, max_cong_dist, true));
      m.push_back(MAKE_META(PairingParams, REAL, min_overlap, true));
      m.push_back(MAKE_META(PairingParams, REAL, frame_rate, true));
      m.push_back(MAKE_META(PairingParams, BOOL, parallel, false));
      m.push_back(MAKE_META(PairingParams, COMPATIBLE_OBJECT, bounds, true));
      return m;
   };
   static vector<MemberMetaData> meta = make_meta();
   return meta;
}

void PairingParams::validate() const noexcept(false)
{
   auto check = [](const char* name, real value, bool ok, const char* rule) {
      if(!std::isfinite(value))
         throw std::runtime_error(
             format("pairing parameter '{}' must be finite", name));
      if(!ok)
         throw std::runtime_error(format(
             "pairing parameter '{}' = {} out of range, expected {}",
             name,
             value,
             rule));
   };

   check("min_overlap", min_overlap, min_overlap > 0.0, "> 0");
   check("max_dist", max_dist, max_dist > 0.0, "> 0");
   check("min_dist", min_dist, min_dist >= 0.0, ">= 0");
   check("max_cong_dist", max_cong_dist, max_cong_dist > 0.0, "> 0");
   check("frame_rate", frame_rate, frame_rate > 0.0, "> 0");
}

} // namespace spindle
