
#include "json-io.hpp"

#include "spindle/utils/math.hpp"

namespace spindle
{
// ------------------------------------------------------------------------ Load

double load_numeric(const Json::Value& elem) noexcept(false)
{
   if(elem.isNull())
      return dNAN;
   else if(!elem.isNumeric())
      throw std::runtime_error(format("expected numeric value"));
   return elem.asDouble();
}

void json_load(const Json::Value& node, Vector3& v)
{
   if(!node.isArray()) throw std::runtime_error("expecting JSON array value");
   if(node.size() != v.size())
      throw std::runtime_error(format("incorrect number of elements in array "
                                      "value. Expected {}, but got {}.",
                                      v.size(),
                                      node.size()));
   for(unsigned i = 0; i < v.size(); ++i) v[int(i)] = load_numeric(node[i]);
}

void json_load(const Json::Value& node, bool& v)
{
   if(!node.isBool()) throw std::runtime_error("expected boolean value");
   v = node.asBool();
}
void json_load(const Json::Value& node, int& v)
{
   if(!node.isInt()) throw std::runtime_error("expected integer value");
   v = node.asInt();
}
void json_load(const Json::Value& node, unsigned& v)
{
   if(!node.isUInt()) throw std::runtime_error("expected unsigned value");
   v = node.asUInt();
}
void json_load(const Json::Value& node, float& v)
{
   v = float(load_numeric(node));
}
void json_load(const Json::Value& node, double& v) { v = load_numeric(node); }
void json_load(const Json::Value& node, std::string& v)
{
   if(!node.isString()) throw std::runtime_error("expected string value");
   v = node.asString();
}

Json::Value get_key(const Json::Value& node, const char* key)
{
   if(!node.isObject() or !node.isMember(key))
      throw std::runtime_error(format("key '{}' missing", key));
   return node[key];
}

// ------------------------------------------------------------------------ Save

Json::Value json_save(const bool& x) { return Json::Value(x); }
Json::Value json_save(const int& x) { return Json::Value(x); }
Json::Value json_save(const unsigned& x) { return Json::Value(x); }
Json::Value json_save(const float& x)
{
   return (std::isfinite(x)) ? Json::Value(double(x))
                             : Json::Value(Json::nullValue);
}
Json::Value json_save(const double& x)
{
   return (std::isfinite(x)) ? Json::Value(x) : Json::Value(Json::nullValue);
}

Json::Value json_save(const string& s) { return Json::Value(s); }

Json::Value json_save(const Vector3& v)
{
   Json::Value X(Json::arrayValue);
   X.resize(v.size());
   for(unsigned i = 0; i < v.size(); ++i) X[i] = json_save(v[int(i)]);
   return X;
}

// ------------------------------------------------------------------ Parse JSON

Json::Value parse_json(const std::string& s) noexcept(false)
{
   static thread_local Json::CharReaderBuilder json_parser_builder_;
   auto reader
       = unique_ptr<Json::CharReader>(json_parser_builder_.newCharReader());

   Json::Value root;
   std::string err = "";

   try {
      if(!reader->parse(s.data(), s.data() + s.size(), &root, &err))
         err = format("error reading JSON data: {}", err);
   } catch(Json::Exception& e) {
      err = format("error reading JSON data: {}", e.what());
   }

   if(err != "") throw std::runtime_error(err);
   return root;
}

bool parse_json(const string& s, Json::Value& val) noexcept
{
   try {
      val = parse_json(s);
      return true;
   } catch(std::exception&) {
      // not JSON
   }
   return false;
}

} // namespace spindle
