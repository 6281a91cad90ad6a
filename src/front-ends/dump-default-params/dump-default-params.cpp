
#include "stdinc.hpp"

#include "dump-default-params-inc.hpp"

#include "spindle/pairing/pairing-params.hpp"
#include "spindle/utils/cli-utils.hpp"
#include "spindle/utils/file-system.hpp"

namespace spindle::dump_default_params
{
// ---------------------------------------------------------------------- config

struct Config
{
   bool has_error   = false;
   bool show_help   = false;
   string out_fname = ""s; // stdout if empty
};

// ------------------------------------------------------------------- show-help

static void show_help(string argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [-o <filename>]

      -o <filename>      File to save the default parameters to. If not
                         given, they are printed to stdout.

   Example:

      > {:s} -o /tmp/params.json

{:s})V0G0N",
                  basename(argv0),
                  basename(argv0),
                  "");
}

// -------------------------------------------------------------------- run main

int run_main(int argc, char** argv)
{
   Config config;
   auto& has_error = config.has_error;

   // ---- Parse command line
   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-o"s) {
            config.out_fname = cli::safe_arg_str(argc, argv, i);
         } else {
            cout << format("Unexpected argument '{}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         has_error = true;
      }
   }

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   // ---- Action
   PairingParams params;
   if(config.out_fname.empty()) {
      cout << params.to_json_string() << endl;
      return EXIT_SUCCESS;
   }

   bool success = false;
   try {
      save(params, config.out_fname);
      INFO(format("default parameters saved to '{:s}'", config.out_fname));
      success = true;
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {:s}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace spindle::dump_default_params
