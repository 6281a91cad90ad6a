
#include "config.hpp"

#include "stdinc.hpp"

#include "json/json.h"

#include <stdlib.h>

#include <mutex>

namespace spindle
{
struct EnvironmentVariables
{
   bool is_init    = false;
   bool trace_mode = false;
   int log_level   = 1;

   string make_config_info_str();
   void init_config(const Json::Value& o);
};

static EnvironmentVariables env_vars_;

static void init_instance(const Json::Value& o) noexcept
{
   env_vars_.init_config(o);
}

static EnvironmentVariables& instance()
{
   if(!env_vars_.is_init)
      FATAL(format("Must call 'load_environment_variables()' before attempting "
                   "to load any environmental variables"));
   return env_vars_;
}

// -------------------------------------------------------- make config info str
//
string EnvironmentVariables::make_config_info_str()
{
   auto make_build_str = []() {
      std::stringstream ss{""};
      bool needs_comma = false;
      auto push_ss     = [&](const string_view s) {
         if(needs_comma) ss << ", ";
         ss << s;
         needs_comma = true;
      };
      auto push_bool = [&](bool val, const string_view s) {
         if(val) push_ss(s);
      };
      push_bool(k_is_cli_build, "cli");
      push_bool(k_is_testcase_build, "testcases");
      push_bool(k_is_debug_build, "debug");
      push_bool(k_is_release_build, "release");
      push_bool(k_is_asan_build, "asan");
      push_bool(k_has_opencv, "opencv");
      return ss.str();
   };

   return format(R"V0G0N(
   k-spindle-version             = '{}'
   build-configuration           =  {}
   SPINDLE_TRACE_MODE            =  {}
   SPINDLE_LOG_LEVEL             =  {}
)V0G0N",
                 k_version,
                 make_build_str(),
                 str(trace_mode),
                 log_level);
}

// -------------------------------------------------------------------- read-env
//
static Json::Value read_env()
{
   Json::Value o{Json::objectValue};

   auto get_w_default
       = [&o](const std::string_view name,
              const std::string_view default_value) -> std::string {
      const char* ss = getenv(name.data());
      const auto ret
          = (ss == nullptr) ? std::string(default_value) : std::string(ss);
      o[string(name)] = ret;
      return ret;
   };

   auto get_bool_w_default = [&](const std::string_view name) -> bool {
      const auto val  = get_w_default(name, "");
      const auto ret  = (val == std::string("1") or val == std::string("true"));
      o[string(name)] = ret;
      return ret;
   };

   auto get_int_w_default = [&](const std::string_view name, int def) -> int {
      const auto s = get_w_default(name, "");
      int ret      = def;
      if(s.size() > 0) {
         if(lexical_cast(trim_copy(s), ret))
            FATAL(
                format("bad lexical cast reading environment variable {}='{}' "
                       "as an integer",
                       name,
                       s));
      }
      o[string(name)] = ret;
      return ret;
   };

   get_bool_w_default("SPINDLE_TRACE_MODE");
   get_int_w_default("SPINDLE_LOG_LEVEL", 1);

   return o;
}

static const Json::Value& get_env_data()
{
   static std::mutex padlock_;
   static bool first_run_ = true;
   static Json::Value env_data_;
   {
      std::lock_guard<decltype(padlock_)> lock(padlock_);
      if(first_run_) {
         env_data_  = read_env();
         first_run_ = false;
      }
   }

   return env_data_;
}

// ----------------------------------------------------------------- init config
//
void EnvironmentVariables::init_config(const Json::Value& o)
{
   auto get_bool = [&](const char* key, bool def) {
      return o.isMember(key) ? o[key].asBool() : def;
   };
   auto get_int = [&](const char* key, int def) {
      return o.isMember(key) ? o[key].asInt() : def;
   };

   trace_mode = get_bool("SPINDLE_TRACE_MODE", false);
   log_level  = get_int("SPINDLE_LOG_LEVEL", 1);

   switch(log_level) {
   case 1: set_log_info(); break;
   case 2: set_log_warn(); break;
   case 3: set_log_error(); break;
   default:
      WARN(format("SPINDLE_LOG_LEVEL={} out of range [1..3], using 1",
                  log_level));
      log_level = 1;
      set_log_info();
   }

   is_init = true;
}

// -------------------------------------------------- load environment variables
//

void load_environment_variables() noexcept { init_instance(get_env_data()); }

// --------------------------------------------------------------------- getters
//
bool spindle_trace_mode() noexcept
{
   // Logging may happen before the environment is loaded
   return env_vars_.is_init and env_vars_.trace_mode;
}

// ---------------------------------------------------------- configuration-info
//
string environment_info() noexcept { return instance().make_config_info_str(); }

} // namespace spindle
