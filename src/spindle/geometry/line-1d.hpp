
#pragma once

#include "spindle/foundation.hpp"

namespace spindle
{
// Half-open interval [a, b)
template<typename T> struct Line1DT
{
   static_assert(std::is_arithmetic<T>::value);

   T a = T(0);
   T b = T(0);

   Line1DT() = default;
   Line1DT(T a_, T b_)
       : a(a_)
       , b(b_)
   {}

   bool operator==(const Line1DT& o) const noexcept
   {
      return (a == o.a) and (b == o.b);
   }
   bool operator!=(const Line1DT& o) const noexcept { return !(*this == o); }

   T length() const noexcept { return b - a; }
   bool empty() const noexcept { return !(a < b); }

   string to_string() const noexcept { return format("[{}, {})", a, b); }

   friend string str(const Line1DT& ll) noexcept { return ll.to_string(); }
};

// NOTE: unlike a set intersection, the result keeps 'b < a' when the
// intervals are disjoint, so that 'length()' reports the (negative) gap.
template<typename T>
Line1DT<T> overlap_1d(const Line1DT<T>& A, const Line1DT<T>& B) noexcept
{
   return Line1DT<T>(std::max(A.a, B.a), std::min(A.b, B.b));
}

using Line1D = Line1DT<real>;

} // namespace spindle
