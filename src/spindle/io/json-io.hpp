
#pragma once

#include "json/json.h"

#include "spindle/foundation.hpp"
#include "spindle/geometry/vector-3.hpp"

namespace spindle
{
void json_load(const Json::Value& node, bool&);
void json_load(const Json::Value& node, int&);
void json_load(const Json::Value& node, unsigned&);
void json_load(const Json::Value& node, float&);
void json_load(const Json::Value& node, double&);
void json_load(const Json::Value& node, std::string&);
void json_load(const Json::Value& node, Vector3&);

// 'null' loads as NAN
double load_numeric(const Json::Value& elem) noexcept(false);

template<typename T>
inline void
json_load_t(const Json::Value& node,
            vector<T>& o,
            std::function<void(const Json::Value& node, T& value)> f)
{
   if(!node.isArray()) throw std::runtime_error("expected an array");
   o.resize(node.size());
   for(auto i = 0u; i < o.size(); ++i) f(node[i], o[i]);
}

Json::Value json_save(const bool&);
Json::Value json_save(const int&);
Json::Value json_save(const unsigned&);
Json::Value json_save(const float&);
Json::Value json_save(const double&); // Non-finite values are saved as 'null'
Json::Value json_save(const string&);
Json::Value json_save(const Vector3&);

template<typename InputIt>
inline Json::Value
json_save_t(InputIt cbegin,
            InputIt cend,
            std::function<Json::Value(
                typename std::iterator_traits<InputIt>::reference&)> f)
{
   Json::Value x{Json::arrayValue};
   x.resize(unsigned(std::distance(cbegin, cend)));
   for(auto i = 0u; i < x.size(); ++i) x[i] = f(*cbegin++);
   return x;
}

template<typename T> inline string json_encode(const T& o)
{
   std::stringstream ss("");
   ss << json_save(o);
   return ss.str();
}

/**
 * For example,
 *
 *      json_load(get_key(node, "max_dist"), max_dist);
 *
 * Throws if 'key' is absent.
 */
Json::Value get_key(const Json::Value& node, const char* key);

inline Json::Value get_key(const Json::Value& node, const string_view& key)
{
   return get_key(node, string(key).c_str());
}

inline bool has_key(const Json::Value& node, const string_view& key)
{
   if(node.type() != Json::objectValue) return false;
   return node.isMember(string(key));
}

Json::Value parse_json(const string& s) noexcept(false); // that-is throws

// RETURN true if parsing was successful
bool parse_json(const string& s, Json::Value& val) noexcept;

template<typename T>
inline T json_load_key(const Json::Value& node,
                       const string_view key,
                       const string_view operation) noexcept(false)
{
   if(!has_key(node, key))
      throw std::runtime_error(
          format("failed to find key '{}' while {}", key, operation));
   T value;
   try {
      json_load(get_key(node, key), value);
   } catch(std::runtime_error& e) {
      throw std::runtime_error(format(
          "error loading key '{}' while {}: {}", key, operation, e.what()));
   }
   return value;
}

template<typename T>
inline T json_load_key_w_default(const Json::Value& node,
                                 const string_view key,
                                 const T& default_value,
                                 const string_view operation) noexcept(false)
{
   if(!has_key(node, key)) return default_value;
   return json_load_key<T>(node, key, operation);
}

inline string str(const Json::Value& o) noexcept
{
   std::stringstream ss{""s};
   ss << o;
   return ss.str();
}

} // namespace spindle
