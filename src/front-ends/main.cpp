
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include "spindle/foundation.hpp"
#include "spindle/utils/file-system.hpp"

#include "dump-default-params/dump-default-params-inc.hpp"
#include "export-spots/export-spots-inc.hpp"
#include "find-bounds/find-bounds-inc.hpp"
#include "pair-tracks/pair-tracks-inc.hpp"

using namespace spindle;
using namespace std::string_literals;

// ------------------------------------------------------------------------ Runs

static auto make_runs()
{
   std::unordered_map<std::string, std::function<int(int, char**)>> r;
   std::unordered_map<std::string, std::function<std::string()>> b;

#define REGISTER(z)                  \
   {                                 \
      r[#z] = spindle::z ::run_main; \
      b[#z] = spindle::z ::brief;    \
   }

   // -- register -- "main" functions
   REGISTER(pair_tracks);
   REGISTER(find_bounds);
   REGISTER(export_spots);
   REGISTER(dump_default_params);

#undef REGISTER

   return make_pair(r, b);
}

// ------------------------------------------------------------------- show-help

static void show_help(const char* arg0)
{
   auto [runs, briefs] = make_runs();

   std::vector<std::string> names;
   for(const auto& ii : runs) names.push_back(ii.first);
   std::sort(names.begin(), names.end());

   auto f = [&](const string& s) {
      auto ii        = briefs.find(s);
      std::string bb = ""s;
      if(ii == cend(briefs)) {
         WARN(format("failed to find brief of '{:s}'", s));
      } else {
         bb = ii->second();
      }
      const int sz = 25 - int(s.size());
      std::string spaces(size_t(std::max(sz, 1)), ' ');

      return format("{:s}{:s}    {:s}", s, spaces, bb);
   };

   cout << format(R"V0G0N(

   Usage: {:s} [-h] <run> [OPTIONS...]

      Run can be one of:

      {:s}

   Environment:

      SPINDLE_TRACE_MODE=1     Logs every decision made while pairing tracks.
      SPINDLE_LOG_LEVEL=<n>    1 (info), 2 (warnings) or 3 (errors only).

)V0G0N",
                  basename(arg0),
                  implode(names.begin(), names.end(), "\n      ", f));
}

// ------------------------------------------------------------------------ main

int main(int argc, char** argv)
{
   if(argc < 2) {
      cout << "Type -h for help" << endl;
      return EXIT_FAILURE;
   }

   const std::string arg = argv[1];
   if(arg == "--help"s || arg == "-h") {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   auto [runs, briefs] = make_runs();

   // Allow "pair-tracks" as well as "pair_tracks"
   const auto run_name = str_replace("-", "_", arg);
   auto ii             = runs.find(run_name);
   if(ii == runs.end()) {
      WARN(format("Failed to find run '{:s}'", arg));
      return EXIT_FAILURE;
   }

   // Init environment variables
   spindle::load_environment_variables();

   // Now "shift" argv[0] to argv[1]
   return ii->second(argc - 1, &argv[1]);
}
