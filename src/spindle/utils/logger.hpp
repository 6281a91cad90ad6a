
#pragma once

#include "fmt/format.h"
#include "string-utils.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <unistd.h>

#define INFO(m)                        \
   if(::spindle::get_log_level() <= 1) \
   ::spindle::Logger::report(1, __FILE__, __LINE__, ::spindle::str(m))
#define WARN(m)                        \
   if(::spindle::get_log_level() <= 2) \
   ::spindle::Logger::report(2, __FILE__, __LINE__, ::spindle::str(m))
#define LOG_ERR(m)                     \
   if(::spindle::get_log_level() <= 3) \
   ::spindle::Logger::report(3, __FILE__, __LINE__, ::spindle::str(m))
#define FATAL(m) \
   ::spindle::Logger::report(4, __FILE__, __LINE__, ::spindle::str(m))
#define TRACE(m)                        \
   if(::spindle::spindle_trace_mode()) \
   ::spindle::Logger::report(5, __FILE__, __LINE__, ::spindle::str(m))

namespace spindle
{
using fmt::format;
using std::string;

bool spindle_trace_mode() noexcept; // config.cpp

inline int get_log_level();
inline void set_log_info();  // 1
inline void set_log_warn();  // 2
inline void set_log_error(); // 3
// Fatal is always logged

class Logger;

} // namespace spindle

// -------------------------------------------------------------- Implementation

namespace spindle
{
class Logger
{
 private:
   static Logger* instance()
   {
      static Logger instance_;
      return &instance_;
   }

   static const char* level_to_string(int level)
   {
      if(colours_enabled()) {
         switch(level) {
         case 1: return ANSI_COLOUR_BLUE "INFO " ANSI_COLOUR_RESET;
         case 2: return ANSI_COLOUR_YELLOW "WARN " ANSI_COLOUR_RESET;
         case 3: return ANSI_COLOUR_RED "ERROR" ANSI_COLOUR_RESET;
         case 4: return ANSI_COLOUR_RED "FATAL" ANSI_COLOUR_RESET;
         case 5:
            return "\x1b[42m\x1b[97m"
                   "TRACE" ANSI_COLOUR_RESET;
         default: break;
         }
      } else {
         switch(level) {
         case 1: return "INFO ";
         case 2: return "WARN ";
         case 3: return "ERROR";
         case 4: return "FATAL";
         case 5: return "TRACE";
         default: break;
         }
      }
      return "?";
   }

   bool _colours;
   int _log_level;

   Logger() { init(); }
   ~Logger() = default;

   void init()
   {
      _colours   = (isatty(STDOUT_FILENO) != 0);
      _log_level = 0;
   }

 public:
   static void
   report(int level, const char* file, int lineno, const string& msg)
   {
      if(level >= log_level() && level <= 5) {
         std::ostream& out = std::cout;
         sync_write([&]() {
            if(colours_enabled())
               out << level_to_string(level) << " " << ANSI_COLOUR_GREY
                   << file << ":" << lineno << ANSI_COLOUR_RESET << " " << msg
                   << "\n";
            else
               out << level_to_string(level) << " " << file << ":" << lineno
                   << " " << msg << "\n";
            out.flush();
         });
         if(level == 4) {
            exit(1); // Die on fatal
         }
      }
   }

   static int log_level() { return instance()->_log_level; }

   static void set_log_level(int level)
   {
      if(level > 0 && level <= 5)
         instance()->_log_level = level;
      else
         report(
             2, __FILE__, __LINE__, format("Invalid log level: {}", level));
   }

   static bool colours_enabled() { return instance()->_colours; }
};

} // namespace spindle

inline int ::spindle::get_log_level() { return ::spindle::Logger::log_level(); }
inline void ::spindle::set_log_info() { ::spindle::Logger::set_log_level(1); }
inline void ::spindle::set_log_warn() { ::spindle::Logger::set_log_level(2); }
inline void ::spindle::set_log_error() { ::spindle::Logger::set_log_level(3); }
