
#include "stdinc.hpp"

#include "export-spots-inc.hpp"

#include "spindle/pairing/spot-export.hpp"
#include "spindle/tracks/track-set.hpp"
#include "spindle/utils/cli-utils.hpp"
#include "spindle/utils/file-system.hpp"

namespace spindle::export_spots
{
// ---------------------------------------------------------------------- config

struct Config
{
   bool has_error           = false;
   bool show_help           = false;
   bool allow_overwrite     = false;
   string track_set_fname   = ""s;
   string predictions_fname = ""s;
   string out_fname         = ""s;
   string coords_fname      = ""s; // optional
   string cell_ids_fname    = ""s; // optional
};

// ------------------------------------------------------------------- show-help

static void show_help(string argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...]

      --track-set <filename>    Track-set json file (spots, tracks, edges).
      --predictions <filename>  Classifier output, a csv file with the columns
                                'centID_i', 'centID_j', and 'Predicted_Label'.
      -o <filename>             Output csv file.
      --coords <filename>       Also write the per-frame centroid of each
                                pair, as a tab separated file with the
                                columns Cell, Frame, X, Y, Z.
      --cell-ids <filename>     Also write the cell ids, one per line.
      -y                        Allow overwrite of the output files.

   Example:

      > {:s} --track-set tracks.json --predictions predictions.csv \
           -o /tmp/movie-01/spindles.csv --coords /tmp/movie-01/coords.tsv

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
      if(arg == "-h" || arg == "--help") config.show_help = true;
   }

   if(!config.show_help) {
      for(int i = 1; i < argc; ++i) {
         const string_view arg = argv[i];
         try {
            if(arg == "--track-set"s) {
               config.track_set_fname = cli::safe_arg_str(argc, argv, i);
            } else if(arg == "--predictions"s) {
               config.predictions_fname = cli::safe_arg_str(argc, argv, i);
            } else if(arg == "-o"s) {
               config.out_fname = cli::safe_arg_str(argc, argv, i);
            } else if(arg == "--coords"s) {
               config.coords_fname = cli::safe_arg_str(argc, argv, i);
            } else if(arg == "--cell-ids"s) {
               config.cell_ids_fname = cli::safe_arg_str(argc, argv, i);
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

      auto check_input = [&](const string& fname, const char* what) {
         if(fname.empty()) {
            cout << format("Must specify a {} filename!", what) << endl;
            has_error = true;
         } else if(!is_regular_file(fname)) {
            cout << format("Failed to find {} file: '{:s}'", what, fname)
                 << endl;
            has_error = true;
         }
      };

      check_input(config.track_set_fname, "track-set");
      check_input(config.predictions_fname, "predictions");

      if(config.out_fname.empty()) {
         cout << format("Must specify an output filename!") << endl;
         has_error = true;
      }

      for(const auto& fname :
          {config.out_fname, config.coords_fname, config.cell_ids_fname}) {
         if(!fname.empty() and !config.allow_overwrite
            and is_regular_file(fname)) {
            LOG_ERR(format("cowardly refusing to overwrite '{}'", fname));
            has_error = true;
         }
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
   bool success = false;
   try {
      const auto track_set = load_track_set(config.track_set_fname);
      const auto pairs
          = read_accepted_pairs(file_get_contents(config.predictions_fname));
      INFO(format("{} accepted pairs in '{}'",
                  pairs.size(),
                  config.predictions_fname));

      const auto spots = make_spot_export(track_set, pairs);
      const auto ec    = file_put_contents(config.out_fname, spots.to_csv());
      if(ec) throw std::system_error(ec, config.out_fname);

      INFO(format("wrote {} spots to '{}'", spots.rows.size(), config.out_fname));

      if(!config.coords_fname.empty() or !config.cell_ids_fname.empty()) {
         const auto coords = make_cell_coords(track_set, pairs);
         auto write = [&](const string& fname, const string& data) {
            if(fname.empty()) return;
            const auto ec = file_put_contents(fname, data);
            if(ec) throw std::system_error(ec, fname);
         };
         write(config.coords_fname, coords.to_tsv());
         write(config.cell_ids_fname, coords.cell_ids_text());
         INFO(format("wrote {} centroids of {} cells",
                     coords.rows.size(),
                     coords.cell_ids().size()));
      }

      success = true;
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {:s}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace spindle::export_spots
