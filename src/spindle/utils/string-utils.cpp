
#include "string-utils.hpp"

namespace spindle
{
// --------------------------------------------------------------------- explode

std::vector<string> explode(const std::string_view line,
                            const std::string_view delims,
                            const bool collapse_empty_fields) noexcept(false)
{
   std::vector<string> o;

   if(line.empty()) return o;

   auto push_it = [&](const auto pos0, const auto pos1) {
      const auto sz = (pos1 == string::npos)
                          ? (string::size_type(line.size()) - pos0)
                          : (pos1 - pos0);
      const auto s  = line.substr(pos0, sz);
      if(!s.empty() or !collapse_empty_fields)
         o.push_back(string(cbegin(s), cend(s)));

      return (pos1 == string::npos) ? string::npos : pos1 + 1;
   };

   string::size_type pos = 0;
   while(pos != string::npos) {
      const auto new_pos = line.find_first_of(delims, pos);
      pos                = push_it(pos, new_pos);
   }

   return o;
}

// ----------------------------------------------------------------- str replace

string str_replace(const string_view search,
                   const string_view replace,
                   const string_view subject) noexcept
{
   if(subject.empty() or search.empty())
      return string(subject.data(), subject.size());

   std::stringstream ss{""};

   const size_t search_sz  = search.size();
   const size_t subject_sz = subject.size();

   if(subject_sz < search_sz) return string(subject.data(), subject.size());

   size_t pos = 0, last_pos = 0;
   while(pos <= subject_sz - search_sz) {
      auto ii = subject.find(search, pos);
      if(ii == string_view::npos) break;
      ss << subject.substr(last_pos, ii - last_pos) << replace;
      pos      = ii + search_sz;
      last_pos = pos;
   }

   if(last_pos < subject_sz) ss << subject.substr(last_pos);

   return ss.str();
}

} // namespace spindle
