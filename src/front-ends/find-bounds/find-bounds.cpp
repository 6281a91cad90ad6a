
#include "stdinc.hpp"

#include "find-bounds-inc.hpp"

#include "spindle/movie/valid-bounds.hpp"
#include "spindle/utils/cli-utils.hpp"
#include "spindle/utils/file-system.hpp"

namespace spindle::find_bounds
{
// ---------------------------------------------------------------------- config

struct Config
{
   bool has_error       = false;
   bool show_help       = false;
   bool allow_overwrite = false;
   string movie_fname   = ""s;
   int n_zsteps         = 1;
   int n_channels       = 1;
   real pixel_size      = 1.0;
   string out_fname     = ""s; // stdout if empty
};

// ------------------------------------------------------------------- show-help

static void show_help(string argv0)
{
   Config default_config;

   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] --movie <filename>

      --movie <filename>      Registered (zero padded) tiff stack.
      --z-steps <int>         Number of z-steps per frame. Default is {}.
      --channels <int>        Number of channels per z-step. Default is {}.
      --pixel-size <number>   Physical size of a pixel. Default is {}.
      -o <filename>           Write the bounds json here, instead of stdout.
      -y                      Allow overwrite of the output file.

{:s})V0G0N",
                  basename(argv0),
                  default_config.n_zsteps,
                  default_config.n_channels,
                  default_config.pixel_size,
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
      if(arg == "-h" || arg == "--help") config.show_help = true;
   }

   if(!config.show_help) {
      for(int i = 1; i < argc; ++i) {
         const string_view arg = argv[i];
         try {
            if(arg == "--movie"s) {
               config.movie_fname = cli::safe_arg_str(argc, argv, i);
            } else if(arg == "--z-steps"s) {
               config.n_zsteps = cli::safe_arg_int(argc, argv, i);
            } else if(arg == "--channels"s) {
               config.n_channels = cli::safe_arg_int(argc, argv, i);
            } else if(arg == "--pixel-size"s) {
               config.pixel_size = cli::safe_arg_real(argc, argv, i);
            } else if(arg == "-o"s) {
               config.out_fname = cli::safe_arg_str(argc, argv, i);
            } else if(arg == "-y"s) {
               config.allow_overwrite = true;
            } else {
               cout << format("Unexpected argument '{}'", arg) << endl;
               has_error = true;
            }
         } catch(std::runtime_error& e) {
            cout << format("Error on command-line: {:s}", e.what()) << endl;
            has_error = true;
         }
      }

      if(config.movie_fname.empty()) {
         cout << format("Must specify a movie filename!") << endl;
         has_error = true;
      } else if(!is_regular_file(config.movie_fname)) {
         cout << format("Failed to find movie file: '{:s}'",
                        config.movie_fname)
              << endl;
         has_error = true;
      }

      if(!(config.pixel_size > 0.0)) {
         cout << format("Pixel size must be positive, got {}",
                        config.pixel_size)
              << endl;
         has_error = true;
      }

      if(!config.out_fname.empty() and !config.allow_overwrite
         and is_regular_file(config.out_fname)) {
         LOG_ERR(format("cowardly refusing to overwrite '{}'", config.out_fname));
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
   ValidBounds bounds;
   try {
      const auto now    = tick();
      const auto frames = load_movie_frames(
          config.movie_fname, config.n_zsteps, config.n_channels);
      bounds = find_valid_pixel_bounds(frames).scaled(config.pixel_size);
      INFO(format("scanned {} frames in {}ms", frames.size(), ms_tock_s(now)));
   } catch(std::exception& e) {
      LOG_ERR(format("failed to find bounds: {}", e.what()));
      return EXIT_FAILURE;
   }

   if(config.out_fname.empty()) {
      cout << bounds.to_json_string() << endl;
      return EXIT_SUCCESS;
   }

   try {
      save(bounds, config.out_fname);
      INFO(format("bounds saved to '{}'", config.out_fname));
   } catch(std::exception& e) {
      LOG_ERR(format("failed to save bounds: {}", e.what()));
      return EXIT_FAILURE;
   }

   return EXIT_SUCCESS;
}

} // namespace spindle::find_bounds
