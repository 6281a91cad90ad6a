
#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace spindle
{
using std::error_code;

// ------------------------------------------------------- file-get/put-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& out) noexcept;

inline std::string
file_get_contents(const std::string_view fname) noexcept(false)
{
   std::string out;
   const auto ec = file_get_contents(fname, out);
   if(ec) throw std::system_error(ec, std::string(fname));
   return out;
}

error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept;

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename) noexcept;
bool is_directory(const std::string_view filename) noexcept;

// -------------------------------------------------------------------- basename

std::string basename(const std::string_view filename,
                     const bool strip_extension = false) noexcept;

// ----------------------------------------------------------------------- mkdir

bool mkdir_p(const std::string_view dname) noexcept;

// --------------------------------------------------------- make-temp-directory
// make_temp_directory("/tmp/spindle-XXXXXX");
std::string make_temp_directory(const std::string_view p) noexcept(false);

int remove_all(const std::string_view path) noexcept(false);

} // namespace spindle
