
#include "file-system.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>

#include <unistd.h>

namespace spindle
{
namespace fs = std::filesystem;

bool is_regular_file(const std::string_view filename) noexcept
{
   std::error_code ec;
   return fs::is_regular_file(fs::path(filename), ec);
}

bool is_directory(const std::string_view filename) noexcept
{
   std::error_code ec;
   return fs::is_directory(fs::path(filename), ec);
}

// ----------------------------------------------------------- file-get-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& data) noexcept
{
   const std::string path(fname);
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(path.c_str(), "rb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });

   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   if(fseek(fp.get(), 0, SEEK_END) == -1)
      return std::make_error_code(std::errc(errno));

   const auto fpos = ftell(fp.get());
   if(fpos == -1) return std::make_error_code(std::errc(errno));

   try {
      data.resize(size_t(fpos < 0 ? 0 : fpos));
   } catch(std::length_error&) {
      return std::make_error_code(std::errc::invalid_argument);
   } catch(std::bad_alloc&) {
      return std::make_error_code(std::errc::not_enough_memory);
   }

   if(fseek(fp.get(), 0, SEEK_SET) == -1)
      return std::make_error_code(std::errc(errno));

   if(data.size() > 0
      and data.size() != fread(&data[0], 1, data.size(), fp.get())) {
      if(ferror(fp.get())) return std::make_error_code(std::errc(errno));
      return std::make_error_code(std::errc::io_error);
   }

   if(FILE* ptr = fp.release(); fclose(ptr) != 0)
      return std::make_error_code(std::errc(errno));

   return {};
}

// ----------------------------------------------------------- file-put-contents

error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept
{
   const std::string path(fname);
   FILE* fp = fopen(path.c_str(), "wb");
   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   error_code ec = {};

   const auto sz = fwrite(dat.data(), 1, dat.size(), fp);
   if(sz != dat.size()) {
      if(ferror(fp))
         ec = std::make_error_code(std::errc(errno));
      else
         ec = std::make_error_code(std::errc::io_error);
   }
   if(fclose(fp) != 0)
      if(!ec) ec = std::make_error_code(std::errc(errno));

   return ec;
}

// -------------------------------------------------------------------- basename

std::string basename(const std::string_view filename,
                     const bool strip_extension) noexcept
{
   const auto p = fs::path(filename);
   return strip_extension ? p.stem().string() : p.filename().string();
}

// ----------------------------------------------------------------------- mkdir

bool mkdir_p(const std::string_view dname) noexcept
{
   std::error_code ec;
   fs::create_directories(fs::path(dname), ec);
   return !ec and is_directory(dname);
}

// --------------------------------------------------------- make-temp-directory

std::string make_temp_directory(const std::string_view p) noexcept(false)
{
   std::string s(p);
   while(s.size() < 6 or s.compare(s.size() - 6, 6, "XXXXXX") != 0)
      s.push_back('X');
   if(mkdtemp(&s[0]) == nullptr)
      throw std::runtime_error("failed to create temporary directory");
   return s;
}

// ------------------------------------------------------------------ remove-all

int remove_all(const std::string_view path) noexcept(false)
{
   std::error_code ec;
   const int val = int(fs::remove_all(fs::path(path), ec));
   if(ec)
      throw std::runtime_error("failed to remove directory '"
                               + std::string(path) + "': " + ec.message());
   return val;
}

} // namespace spindle
