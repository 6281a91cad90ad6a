
#include "stdinc.hpp"

#include "pair-tracks-inc.hpp"

#include "spindle/movie/valid-bounds.hpp"
#include "spindle/pairing/candidate-filter.hpp"
#include "spindle/pairing/feature-table.hpp"
#include "spindle/tracks/track-set.hpp"
#include "spindle/utils/cli-utils.hpp"
#include "spindle/utils/file-system.hpp"

namespace spindle::pair_tracks
{
// ---------------------------------------------------------------------- config

struct Config
{
   bool has_error         = false;
   bool show_help         = false;
   bool allow_overwrite   = false;
   bool parallel          = false;
   string track_set_fname = ""s;
   string params_fname    = ""s;
   string movie_fname     = ""s;
   int n_zsteps           = 1;
   int n_channels         = 1;
   real pixel_size        = 1.0; // physical units per pixel
   ValidBounds bounds;            // from the command line
   string outdir = "/tmp"s;
};

// ------------------------------------------------------------------- show-help

static void show_help(string argv0)
{
   Config default_config;

   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] --track-set <filename>

      --track-set <filename>  Track-set json file (spots, tracks, edges).
      -p, --params <filename> Pairing parameters. See 'dump-default-params'.

      --bounds <t> <b> <l> <r>
                              Valid-pixel bounds in physical units. Overrides
                              the 'bounds' in the params file.
      --movie <filename>      Registered tiff stack, used to find the bounds
                              when they are not otherwise given.
      --z-steps <int>         Number of z-steps per frame. Default is {}.
      --channels <int>        Number of channels per z-step. Default is {}.
      --pixel-size <number>   Physical size of a pixel. Default is {}.

      --parallel              Pair tracks using all cores.
      -d <dirname>            Output directory. Default is '{:s}'.
      -y                      Allow overwrite of output files.

   Outputs:

      <dirname>/features.csv      One row per candidate pair.
      <dirname>/rejections.txt    One line per rejected track, or pair.
      <dirname>/params.json       The parameters used.

   Example:

      > {:s} --track-set tracks.json --movie registered.tif --z-steps 5 \
           --pixel-size 0.108 -d /tmp/movie-01

{:s})V0G0N",
                  basename(argv0),
                  default_config.n_zsteps,
                  default_config.n_channels,
                  default_config.pixel_size,
                  default_config.outdir,
                  basename(argv0),
                  "");
}

// ------------------------------------------------------------ parse-arguments

static Config parse_arguments(int argc, char** argv)
{
   Config config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      if(arg == "-h" || arg == "--help") config.show_help = true;
   }
   if(config.show_help) return config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "--track-set"s) {
            config.track_set_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-p"s or arg == "--params"s) {
            config.params_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--bounds"s) {
            config.bounds.top    = cli::safe_arg_real(argc, argv, i);
            config.bounds.bottom = cli::safe_arg_real(argc, argv, i);
            config.bounds.left   = cli::safe_arg_real(argc, argv, i);
            config.bounds.right  = cli::safe_arg_real(argc, argv, i);
         } else if(arg == "--movie"s) {
            config.movie_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--z-steps"s) {
            config.n_zsteps = cli::safe_arg_int(argc, argv, i);
         } else if(arg == "--channels"s) {
            config.n_channels = cli::safe_arg_int(argc, argv, i);
         } else if(arg == "--pixel-size"s) {
            config.pixel_size = cli::safe_arg_real(argc, argv, i);
         } else if(arg == "--parallel"s) {
            config.parallel = true;
         } else if(arg == "-d"s) {
            config.outdir = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-y"s) {
            config.allow_overwrite = true;
         } else {
            cout << format("Unexpected argument '{}'", arg) << endl;
            config.has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         config.has_error = true;
      }
   }

   // ---- Sanity checks
   if(config.track_set_fname.empty()) {
      cout << format("Must specify a track-set filename!") << endl;
      config.has_error = true;
   } else if(!is_regular_file(config.track_set_fname)) {
      cout << format("Failed to find track-set file: '{:s}'",
                     config.track_set_fname)
           << endl;
      config.has_error = true;
   }

   if(!config.params_fname.empty() and !is_regular_file(config.params_fname)) {
      cout << format("Failed to find params file: '{:s}'", config.params_fname)
           << endl;
      config.has_error = true;
   }

   if(!config.movie_fname.empty() and !is_regular_file(config.movie_fname)) {
      cout << format("Failed to find movie file: '{:s}'", config.movie_fname)
           << endl;
      config.has_error = true;
   }

   if(!(config.pixel_size > 0.0)) {
      cout << format("Pixel size must be positive, got {}", config.pixel_size)
           << endl;
      config.has_error = true;
   }

   if(!config.allow_overwrite) {
      for(const auto fname : {"features.csv", "rejections.txt", "params.json"}) {
         const auto path = format("{}/{}", config.outdir, fname);
         if(is_regular_file(path)) {
            LOG_ERR(format("cowardly refusing to overwrite '{}'", path));
            config.has_error = true;
         }
      }
   }

   return config;
}

// -------------------------------------------------------------- resolve-bounds
// Command line, then params file, then the movie.
static ValidBounds resolve_bounds(const Config& config,
                                  const ValidBounds& params_bounds)
{
   if(config.bounds.is_set()) return config.bounds;
   if(params_bounds.is_set()) return params_bounds;
   if(config.movie_fname.empty()) return ValidBounds{};

   const auto now    = tick();
   const auto frames = load_movie_frames(
       config.movie_fname, config.n_zsteps, config.n_channels);
   const auto px_bounds = find_valid_pixel_bounds(frames);
   INFO(format("found valid-pixel bounds [{}, {}, {}, {}] from {} frames of "
               "'{}' in {}ms",
               px_bounds.top,
               px_bounds.bottom,
               px_bounds.left,
               px_bounds.right,
               frames.size(),
               config.movie_fname,
               ms_tock_s(now)));
   return px_bounds.scaled(config.pixel_size);
}

// -------------------------------------------------------------------- run main

int run_main(int argc, char** argv)
{
   const Config config = parse_arguments(argc, argv);

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(config.has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   if(!is_directory(config.outdir) and !mkdir_p(config.outdir)) {
      LOG_ERR(format("failed to create output directory '{}'", config.outdir));
      return EXIT_FAILURE;
   }

   // ---- Load inputs
   PairingParams params;
   try {
      if(!config.params_fname.empty()) load(params, config.params_fname);
      if(config.parallel) params.parallel = true;
      params.bounds = resolve_bounds(config, params.bounds);
   } catch(std::exception& e) {
      LOG_ERR(format("failed to load parameters: {}", e.what()));
      return EXIT_FAILURE;
   }

   TrackSet track_set;
   try {
      const auto now = tick();
      track_set      = load_track_set(config.track_set_fname);
      INFO(format("loaded {} in {}ms", track_set.brief_info(), ms_tock_s(now)));
   } catch(std::exception& e) {
      LOG_ERR(format("failed to load track-set '{}': {}",
                     config.track_set_fname,
                     e.what()));
      return EXIT_FAILURE;
   }

   // ---- Action
   PairingResult result;
   try {
      const auto now = tick();
      result         = find_pair_candidates(track_set, params);
      INFO(format("{} in {}ms", result.brief_info(), ms_tock_s(now)));
   } catch(std::runtime_error& e) {
      FATAL(format("pairing failed: {}", e.what()));
   }

   const auto table = make_feature_table(result.cells);

   // ---- Outputs
   bool success = true;
   auto output  = [&](const string& fname, const string_view dat) {
      const auto path = format("{}/{}", config.outdir, fname);
      const auto ec   = file_put_contents(path, dat);
      if(ec) {
         LOG_ERR(format("failed to write '{}': {}", path, ec.message()));
         success = false;
      } else {
         INFO(format("wrote '{}'", path));
      }
   };

   output("features.csv", table.to_csv());
   output("rejections.txt", result.rejection_log());
   output("params.json", params.to_json_string());

   if(table.empty()) WARN("no candidate pairs found");

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace spindle::pair_tracks
