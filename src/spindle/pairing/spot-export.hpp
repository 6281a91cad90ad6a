
#pragma once

#include "spindle/tracks/track-set.hpp"

namespace spindle
{
// An accepted pair of tracks, as labelled by the classifier
struct TrackPair
{
   int id_i = -1;
   int id_j = -1;

   bool operator==(const TrackPair& o) const noexcept
   {
      return id_i == o.id_i and id_j == o.id_j;
   }
   bool operator!=(const TrackPair& o) const noexcept { return !(*this == o); }
};

// Reads a predictions CSV with (at least) the columns 'centID_i',
// 'centID_j', and 'Predicted_Label'. Keeps rows labelled 1, dropping a pair
// if its mirror has already been seen.
// Throws std::runtime_error on a missing column or a malformed value.
vector<TrackPair> read_accepted_pairs(const string_view csv) noexcept(false);

// Spot ids of 'track_id' at the integer frames [ceil(start), stop).
// Throws std::runtime_error if the track is unknown.
vector<int> link_track_spots(const TrackSet& track_set,
                             const int track_id) noexcept(false);

struct SpotExportRow
{
   string label; // Cent_<n>a or Cent_<n>b
   int track_id = -1;
   Spot spot;
};

struct SpotExport
{
   vector<SpotExportRow> rows;

   static const vector<string>& column_names() noexcept;
   string to_csv() const noexcept;
};

// The n-th pair (from 1) labels the spots of its two tracks
// 'Cent_<n>a' and 'Cent_<n>b'.
SpotExport make_spot_export(const TrackSet& track_set,
                            const vector<TrackPair>& pairs) noexcept(false);

// The centroid of an accepted pair at one frame
struct CellCoordsRow
{
   string cell; // Cell_<n>
   int frame = 0;
   Vector3 X;
};

struct CellCoords
{
   vector<CellCoordsRow> rows;

   static const vector<string>& column_names() noexcept;
   string to_tsv() const noexcept; // tab separated, with a header

   vector<string> cell_ids() const noexcept; // unique, in row order
   string cell_ids_text() const noexcept;    // one id per line
};

// The n-th pair (from 1) becomes 'Cell_<n>', placed at the midpoint of its
// two tracks' spots, over the frames where both tracks have a spot.
// Throws std::runtime_error if a track is unknown.
CellCoords make_cell_coords(const TrackSet& track_set,
                            const vector<TrackPair>& pairs) noexcept(false);

} // namespace spindle
