
#include "struct-meta.hpp"

#include "spindle/io/json-io.hpp"
#include "spindle/utils/math.hpp"

#define This MemberMetaData

namespace spindle
{
// ---------------------------------------------------------------- construction
//
This::This(
    meta_type t, string member_name, bool eq, cref_fun cf, ref_fun rf) noexcept
    : type_(t)
    , cref_(std::move(cf))
    , ref_(std::move(rf))
    , name_(std::move(member_name))
    , important_in_eq_(eq)
{
   Expects(cref_ != nullptr);
   Expects(ref_ != nullptr);
}

const MetaCompatible* This::object_cref_(const MetaCompatible* o) const noexcept
{
   return static_cast<const MetaCompatible*>(cref_(o));
}

MetaCompatible* This::object_ref_(MetaCompatible* o) const noexcept
{
   return static_cast<MetaCompatible*>(ref_(o));
}

// -------------------------------------------------------------------------- eq
//
bool This::eq(const MetaCompatible* u, const MetaCompatible* v) const noexcept
{
   if(!important_in_eq_) return true;

   switch(type_) {
   case meta_type::BOOL: return get_<bool>(u) == get_<bool>(v);
   case meta_type::INT: return get_<int>(u) == get_<int>(v);
   case meta_type::UNSIGNED: return get_<unsigned>(u) == get_<unsigned>(v);
   case meta_type::REAL: {
      const auto a = get_<real>(u);
      const auto b = get_<real>(v);
      return float_is_same(a, b) or is_close(a, b);
   }
   case meta_type::STRING: return get_<string>(u) == get_<string>(v);
   case meta_type::COMPATIBLE_OBJECT:
      return *object_cref_(u) == *object_cref_(v);
   }

   return false;
}

// ------------------------------------------------------------------- to_stream
//
std::ostream&
This::to_stream(const MetaCompatible* x, std::ostream& ss, int indent) const
    noexcept
{
   switch(type_) {
   case meta_type::BOOL: ss << str(get_<bool>(x)); break;
   case meta_type::INT: ss << get_<int>(x); break;
   case meta_type::UNSIGNED: ss << get_<unsigned>(x); break;
   case meta_type::REAL: {
      const auto val = get_<real>(x);
      if(std::isfinite(val))
         ss << format("{}", val);
      else
         ss << "null";
   } break;
   case meta_type::STRING: ss << json_encode(get_<string>(x)); break;
   case meta_type::COMPATIBLE_OBJECT:
      object_cref_(x)->to_stream(ss, indent);
      break;
   }
   return ss;
}

// --------------------------------------------------------------------- to_json
//
Json::Value This::to_json(const MetaCompatible* x) const noexcept
{
   switch(type_) {
   case meta_type::BOOL: return json_save(get_<bool>(x));
   case meta_type::INT: return json_save(get_<int>(x));
   case meta_type::UNSIGNED: return json_save(get_<unsigned>(x));
   case meta_type::REAL: return json_save(get_<real>(x));
   case meta_type::STRING: return json_save(get_<string>(x));
   case meta_type::COMPATIBLE_OBJECT: return object_cref_(x)->to_json();
   }
   return Json::Value{Json::nullValue};
}

// ------------------------------------------------------------------- read_json
//
void This::read(MetaCompatible* x,
                const Json::Value& o,
                const MetaCompatible* defaults,
                const string_view path,
                const bool print_warnings) const noexcept(false)
{
   switch(type_) {
   case meta_type::BOOL: json_load(o, set_<bool>(x)); break;
   case meta_type::INT: json_load(o, set_<int>(x)); break;
   case meta_type::UNSIGNED: json_load(o, set_<unsigned>(x)); break;
   case meta_type::REAL: json_load(o, set_<real>(x)); break;
   case meta_type::STRING: json_load(o, set_<string>(x)); break;
   case meta_type::COMPATIBLE_OBJECT: {
      auto ptr = object_ref_(x);
      ptr->read_with_defaults(o,
                              (defaults == nullptr) ? nullptr
                                                    : object_cref_(defaults),
                              print_warnings,
                              path);
   } break;
   }
}

// ----------------------------------------------------- MetaCompatible::to-json
//
namespace detail
{
   static std::ostream&
   to_stream_with_meta(std::ostream& ss,
                       const vector<MemberMetaData>& meta_data,
                       const MetaCompatible* o,
                       int indent) noexcept
   {
      auto do_indent = [&](int val) {
         for(auto i = 0; i < (3 * val); ++i) ss << ' ';
      };

      ss << "{";
      bool first = true;
      for(const auto& m : meta_data) {
         if(first)
            first = false;
         else
            ss << ',';
         ss << '\n';
         do_indent(indent + 1);
         ss << '"' << m.name() << "\": ";
         m.to_stream(o, ss, indent + 1);
      }
      if(!first) {
         ss << '\n';
         do_indent(indent);
      }
      ss << "}";
      return ss;
   }

   static void
   read_json_with_meta_and_defaults(const vector<MemberMetaData>& meta_data,
                                    MetaCompatible* x,
                                    const Json::Value& o,
                                    const MetaCompatible* defaults,
                                    const string_view path,
                                    const bool print_warnings)
   {
      auto get_path = [&](const string_view name) {
         const char* delim = (path.size() == 0) ? "" : ".";
         return format("{}{}{}", path, delim, name);
      };

      if(!o.isObject())
         throw std::runtime_error(
             format("expected a JSON object at '{}'", path));

      for(const auto& m : meta_data) {
         const auto m_path = get_path(m.name());

         if(!has_key(o, m.name())) {
            if(defaults == nullptr)
               throw std::runtime_error(
                   format("failed to find key '{}'", m_path));
            m.read(x, m.to_json(defaults), defaults, m_path, false);
            if(print_warnings and !k_is_testcase_build)
               WARN(format("using default value for '{}'", m_path));
            continue;
         }

         try {
            m.read(x, o[m.name()], defaults, m_path, print_warnings);
         } catch(std::runtime_error& e) {
            throw std::runtime_error(
                format("error reading '{}': {}", m_path, e.what()));
         }
      }
   }

} // namespace detail

// -------------------------------------------------- MetaCompatible::operator==
//
bool MetaCompatible::operator==(const MetaCompatible& o) const noexcept
{
   if(this == &o) return true;
   const auto& A = meta_data();
   const auto& B = o.meta_data();
   if(&A != &B) return false;
   for(const auto& m : A)
      if(!m.eq(this, &o)) return false;
   return true;
}

bool MetaCompatible::operator!=(const MetaCompatible& o) const noexcept
{
   return !(*this == o);
}

std::ostream& MetaCompatible::to_stream(std::ostream& ss, int indent) const
    noexcept
{
   return detail::to_stream_with_meta(ss, this->meta_data(), this, indent);
}

string MetaCompatible::to_json_string(int indent) const noexcept
{
   std::stringstream ss{""};
   to_stream(ss, indent);
   return ss.str();
}

string MetaCompatible::to_string(int indent) const noexcept
{
   return to_json_string(indent);
}

Json::Value MetaCompatible::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   for(const auto& m : meta_data()) o[m.name()] = m.to_json(this);
   return o;
}

void MetaCompatible::read(const Json::Value& val) noexcept(false)
{
   read_with_defaults(val, nullptr, false, ""s);
}

void MetaCompatible::read_with_defaults(const Json::Value& val,
                                        const MetaCompatible* defaults,
                                        const bool print_warnings,
                                        const string_view path)
{
   detail::read_json_with_meta_and_defaults(
       this->meta_data(), this, val, defaults, path, print_warnings);
}

} // namespace spindle
