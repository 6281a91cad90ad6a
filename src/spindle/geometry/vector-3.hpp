
#pragma once

#include "spindle/foundation.hpp"

#include <Eigen/Core>
#include <cmath>

namespace spindle
{
// --------------------------------------------------------------------- Vector3

template<typename T> class Vector3T
{
 public:
   using value_type = T;

   T x, y, z;

   constexpr Vector3T()
       : x(T(0.0))
       , y(T(0.0))
       , z(T(0.0))
   {}
   constexpr Vector3T(T x_, T y_, T z_)
       : x(x_)
       , y(y_)
       , z(z_)
   {}
   explicit Vector3T(const Eigen::Matrix<T, 3, 1>& v)
       : x(v(0))
       , y(v(1))
       , z(v(2))
   {}

   static Vector3T nan() { return Vector3T(T(NAN), T(NAN), T(NAN)); }

   unsigned size() const { return 3; }

   T quadrance() const { return x * x + y * y + z * z; }
   T norm() const { return std::sqrt(quadrance()); }
   T dot(const Vector3T& o) const { return x * o.x + y * o.y + z * o.z; }
   T distance(const Vector3T& rhs) const { return (*this - rhs).norm(); }

   Eigen::Matrix<T, 3, 1> to_eigen() const
   {
      return Eigen::Matrix<T, 3, 1>(x, y, z);
   }

   T& operator[](int idx) { return (idx == 0) ? x : (idx == 1) ? y : z; }
   const T& operator[](int idx) const
   {
      return (idx == 0) ? x : (idx == 1) ? y : z;
   }

   Vector3T& operator*=(T scalar)
   {
      x *= scalar;
      y *= scalar;
      z *= scalar;
      return *this;
   }
   Vector3T& operator/=(T scalar)
   {
      x /= scalar;
      y /= scalar;
      z /= scalar;
      return *this;
   }
   Vector3T operator*(T scalar) const
   {
      Vector3T res(*this);
      res *= scalar;
      return res;
   }
   Vector3T operator/(T scalar) const
   {
      Vector3T res(*this);
      res /= scalar;
      return res;
   }

   Vector3T& operator+=(const Vector3T& rhs)
   {
      x += rhs.x;
      y += rhs.y;
      z += rhs.z;
      return *this;
   }
   Vector3T& operator-=(const Vector3T& rhs)
   {
      x -= rhs.x;
      y -= rhs.y;
      z -= rhs.z;
      return *this;
   }
   Vector3T operator+(const Vector3T& rhs) const
   {
      Vector3T res(*this);
      res += rhs;
      return res;
   }
   Vector3T operator-(const Vector3T& rhs) const
   {
      Vector3T res(*this);
      res -= rhs;
      return res;
   }
   Vector3T operator-() const { return Vector3T(-x, -y, -z); }

   bool operator==(const Vector3T& rhs) const
   {
      return x == rhs.x && y == rhs.y && z == rhs.z;
   }
   bool operator!=(const Vector3T& rhs) const { return !(*this == rhs); }

   bool is_finite() const
   {
      return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
   }

   std::string to_string(const char* fmt_str = nullptr) const
   {
      if(fmt_str == nullptr) fmt_str = "[{:7.5f}, {:7.5f}, {:7.5f}]";
      return format(fmt::runtime(fmt_str), x, y, z);
   }

   friend std::string str(const Vector3T<T>& o) noexcept
   {
      return o.to_string();
   }
};

template<typename T> Vector3T<T> operator*(double a, const Vector3T<T>& v)
{
   return v * T(a);
}

template<typename T>
std::ostream& operator<<(std::ostream& out, const Vector3T<T>& v)
{
   out << v.to_string();
   return out;
}

using Vector3 = Vector3T<real>;

// ------------------------------------------------------------------- normalize
// The zero vector normalizes to the zero vector
template<typename T> Vector3T<T> normalize(const Vector3T<T>& v) noexcept
{
   const T len = v.norm();
   if(len == T(0)) return Vector3T<T>{};
   return v / len;
}

template<typename T>
T distance(const Vector3T<T>& a, const Vector3T<T>& b) noexcept
{
   return a.distance(b);
}

template<typename T>
Vector3T<T> midpoint(const Vector3T<T>& a, const Vector3T<T>& b) noexcept
{
   return (a + b) * T(0.5);
}

} // namespace spindle
