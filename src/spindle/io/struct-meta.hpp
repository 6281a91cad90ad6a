
#pragma once

#include "spindle/io/json-io.hpp"
#include "spindle/utils/file-system.hpp"
#include "spindle/utils/string-utils.hpp"
#include "json/json.h"

/**
 * Example Usage

struct Params final : public MetaCompatible
{
   virtual ~Params() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   int x   = -1;
   bool y  = false;
   real z  = 1.0;
};

//
// In cpp file
//
const vector<MemberMetaData>& Params::meta_data() const noexcept
{
   auto make_it = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(Params, INT, x, true));
      m.push_back(MAKE_META(Params, BOOL, y, true));
      m.push_back(MAKE_META(Params, REAL, z, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_it();
   return meta_;
}

//
// Now we have:
//
void some_fun()
{
   Params p;
   Json::Value o = p.to_json();
   cout << str(p) << endl;
   p.read(o);
}

*/

namespace spindle
{
// ------------------------------------------------------------------- meta-type
//
enum class meta_type : int {
   BOOL = 0,
   INT,
   UNSIGNED,
   REAL,
   STRING,
   COMPATIBLE_OBJECT
};

struct MetaCompatible;

// -------------------------------------------------------------- MemberMetaData
//
struct MemberMetaData
{
   // Return the address of the member within a given object
   using cref_fun = std::function<const void*(const MetaCompatible*)>;
   using ref_fun  = std::function<void*(MetaCompatible*)>;

 private:
   meta_type type_       = meta_type::BOOL;
   cref_fun cref_        = nullptr;
   ref_fun ref_          = nullptr;
   std::string name_     = ""s;
   bool important_in_eq_ = true;

   // COMPATIBLE_OBJECT members are accessed through their base class
   const MetaCompatible* object_cref_(const MetaCompatible* o) const noexcept;
   MetaCompatible* object_ref_(MetaCompatible* o) const noexcept;

   template<typename T> const T& get_(const MetaCompatible* o) const noexcept
   {
      return *static_cast<const T*>(cref_(o));
   }

   template<typename T> T& set_(MetaCompatible* o) const noexcept
   {
      return *static_cast<T*>(ref_(o));
   }

 public:
   MemberMetaData(meta_type t,
                  string name,
                  bool eq,
                  cref_fun cf,
                  ref_fun rf) noexcept;

   template<typename T1, typename T2>
   MemberMetaData(meta_type t, string name, bool eq, T1 T2::*member)
       : MemberMetaData(
           t,
           std::move(name),
           eq,
           [member](const MetaCompatible* o) -> const void* {
              const T1* ptr = &(static_cast<const T2*>(o)->*member);
              if constexpr(std::is_base_of_v<MetaCompatible, T1>)
                 return static_cast<const MetaCompatible*>(ptr);
              else
                 return ptr;
           },
           [member](MetaCompatible* o) -> void* {
              T1* ptr = &(static_cast<T2*>(o)->*member);
              if constexpr(std::is_base_of_v<MetaCompatible, T1>)
                 return static_cast<MetaCompatible*>(ptr);
              else
                 return ptr;
           })
   {}

   // Getters
   meta_type type() const noexcept { return type_; }
   const string& name() const noexcept { return name_; }
   bool important_in_eq() const noexcept { return important_in_eq_; }

   // Operations
   bool eq(const MetaCompatible* u, const MetaCompatible* v) const noexcept;
   std::ostream&
   to_stream(const MetaCompatible* x, std::ostream& ss, int indent) const
       noexcept;
   Json::Value to_json(const MetaCompatible* u) const noexcept;
   void read(MetaCompatible* x,
             const Json::Value& o,
             const MetaCompatible* defaults, // of the enclosing object
             const string_view path,
             const bool print_warnings) const noexcept(false);
};

#define MAKE_META(clazz, type, member, eq)            \
   {                                                  \
      meta_type::type, #member##s, eq, &clazz::member \
   }

// ------------------------------------------------------------- Meta Compatible
//
struct MetaCompatible
{
 public:
   virtual ~MetaCompatible() {}

   virtual const vector<MemberMetaData>& meta_data() const noexcept = 0;

   bool operator==(const MetaCompatible& o) const noexcept;
   bool operator!=(const MetaCompatible& o) const noexcept;
   std::ostream& to_stream(std::ostream& ss, int indent = 0) const noexcept;
   string to_string(int indent = 0) const noexcept;
   string to_json_string(int indent = 0) const noexcept;
   Json::Value to_json() const noexcept;

   // Every member must be present
   void read(const Json::Value& val) noexcept(false);

   // Missing (or malformed) members are taken from 'defaults', if given
   void read_with_defaults(const Json::Value& val,
                           const MetaCompatible* defaults,
                           const bool print_warnings = true,
                           const string_view path    = ""s);

   // read_with_defaults<Params>(json_object);
   template<typename T>
   void read_with_defaults(const Json::Value& val,
                           const bool print_warnings = true,
                           const string_view path    = ""s)
   {
      T defaults;
      read_with_defaults(val, &defaults, print_warnings, path);
   }

   friend string str(const MetaCompatible& o) noexcept { return o.to_string(); }
};

#define META_READ_WRITE_LOAD_SAVE(TYPE_)                                    \
   inline void read(TYPE_& data, const Json::Value& node) noexcept(false)   \
   {                                                                        \
      TYPE_ defaults;                                                       \
      data.read_with_defaults(node, &defaults);                             \
   }                                                                        \
   inline void read(TYPE_& data, const std::string& in) noexcept(false)     \
   {                                                                        \
      read(data, parse_json(in));                                           \
   }                                                                        \
   inline void write(const TYPE_& data, std::string& out) noexcept(false)   \
   {                                                                        \
      out = data.to_json_string();                                          \
   }                                                                        \
   inline void write(const TYPE_& data, Json::Value& node) noexcept(false)  \
   {                                                                        \
      node = data.to_json();                                                \
   }                                                                        \
   inline void load(TYPE_& data, const string& fname) noexcept(false)       \
   {                                                                        \
      read(data, file_get_contents(fname));                                 \
   }                                                                        \
   inline void save(const TYPE_& data, const string& fname) noexcept(false) \
   {                                                                        \
      std::string s;                                                        \
      write(data, s);                                                       \
      const auto ec = file_put_contents(fname, s);                          \
      if(ec) throw std::system_error(ec, fname);                            \
   }

} // namespace spindle
