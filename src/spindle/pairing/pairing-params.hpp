
#pragma once

#include "spindle/io/struct-meta.hpp"
#include "spindle/utils/math.hpp"

namespace spindle
{
// The valid (non-padding) pixel box of a movie, in the units of the spot
// positions. NAN values mean "unset".
struct ValidBounds final : public MetaCompatible
{
   virtual ~ValidBounds() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real top    = dNAN;
   real bottom = dNAN;
   real left   = dNAN;
   real right  = dNAN;

   ValidBounds() = default;
   ValidBounds(real top_, real bottom_, real left_, real right_) noexcept
       : top(top_)
       , bottom(bottom_)
       , left(left_)
       , right(right_)
   {}

   bool is_set() const noexcept; // all four values are finite
   bool is_valid() const noexcept; // is_set(), top <= bottom, left <= right

   // Distance from (x, y) to the nearest border. Non-positive values are
   // on, or outside, the border.
   real distance_to_border(real x, real y) const noexcept;

   ValidBounds scaled(real factor) const noexcept;
};

struct PairingParams final : public MetaCompatible
{
   virtual ~PairingParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real max_dist      = 11.0; // pairs with a larger mean distance are rejected
   real min_dist      = 4.0;  // pairs never closer than this are rejected
   real max_cong_dist = 4.0;  // congression proximity threshold
   real min_overlap   = 10.0; // same units as track start/stop
   real frame_rate    = 1.0;  // converts a congression count into a duration
   bool parallel      = false;
   ValidBounds bounds;

   // Throws std::runtime_error naming the first offending field
   void validate() const noexcept(false);
};

META_READ_WRITE_LOAD_SAVE(ValidBounds)
META_READ_WRITE_LOAD_SAVE(PairingParams)

} // namespace spindle
