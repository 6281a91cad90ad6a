
#pragma once

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

#include "string-utils.hpp"

namespace spindle
{
constexpr float fNAN  = std::numeric_limits<float>::quiet_NaN();
constexpr double dNAN = std::numeric_limits<double>::quiet_NaN();

// -------------------------------------------------------------------- Float-Eq

namespace detail
{
   template<typename T> inline T default_is_close_epsilon() noexcept
   {
      if constexpr(sizeof(T) == 4)
         return 1e-4f;
      else
         return 1e-6;
   }
} // namespace detail

template<typename T>
inline T relative_epsilon(T a, T b, T relative_tolerance = T(NAN)) noexcept
{
   if(std::isnan(relative_tolerance))
      relative_tolerance = detail::default_is_close_epsilon<T>();
   return relative_tolerance * T(std::max(std::fabs(a), std::fabs(b)));
}

template<typename T>
inline bool is_close(T a, T b, T relative_tolerance = T(NAN)) noexcept
{
   return std::isfinite(a) and std::isfinite(b)
          and T(std::fabs(a - b)) <= relative_epsilon(a, b, relative_tolerance);
}

// NAN == NAN
template<typename T> inline constexpr bool float_is_same(T a, T b) noexcept
{
   return (std::isnan(a) and std::isnan(b)) or (a == b);
}

template<typename T> constexpr T square(T x) noexcept { return x * x; }

// ----------------------------------------------------------- sample statistics

template<typename InputItr>
double calc_average(InputItr begin, InputItr end) noexcept
{
   const auto N = std::distance(begin, end);
   if(N == 0) return dNAN;
   double sum = 0.0;
   for(auto ii = begin; ii != end; ++ii) sum += double(*ii);
   return sum / double(N);
}

} // namespace spindle
