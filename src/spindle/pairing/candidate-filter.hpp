
#pragma once

#include "cell.hpp"
#include "pairing-params.hpp"

#include "spindle/tracks/track-set.hpp"

namespace spindle
{
enum class RejectReason : int {
   OUTSIDE_BORDER = 0, // whole track
   SHORT_DURATION,     // whole track
   OVERLAP_TOO_SHORT,
   TOO_FEW_SAMPLES,
   TOO_FAR_MEAN,
   TOO_FAR_MIN
};

const char* str(const RejectReason x) noexcept;

struct Rejection
{
   int id_i            = -1;
   int id_j            = -1; // -1 for whole-track rejections
   RejectReason reason = RejectReason::OUTSIDE_BORDER;

   bool is_track_rejection() const noexcept { return id_j < 0; }

   bool operator==(const Rejection& o) const noexcept
   {
      return id_i == o.id_i and id_j == o.id_j and reason == o.reason;
   }
   bool operator!=(const Rejection& o) const noexcept { return !(*this == o); }

   string to_string() const noexcept; // a single line, no newline
   friend string str(const Rejection& o) { return o.to_string(); }
};

struct PairingResult
{
   vector<int> pairable_tracks; // ids, ascending
   vector<Cell> cells;          // ordered by (id_i, id_j)
   vector<Rejection> rejections;

   string rejection_log() const noexcept; // one line per rejection
   string brief_info() const noexcept;
};

// Tracks that are inside the bounds, and long enough to be paired.
// Whole-track rejections are appended to 'rejections' (if not null).
vector<int> select_pairable_tracks(const TrackSet& track_set,
                                   const ValidBounds& bounds,
                                   const PairingParams& params,
                                   vector<Rejection>* rejections) noexcept;

// Exactly one of 'cell' and 'rejection' is set, unless the pair was
// silently skipped, in which case neither is.
struct PairOutcome
{
   std::optional<Cell> cell;
   std::optional<Rejection> rejection;

   bool is_skipped() const noexcept { return !cell and !rejection; }
};

// Runs stages one through six of the cascade on the ordered pair (i, j).
PairOutcome evaluate_pair(const TrackSet& track_set,
                          const Track& tt_i,
                          const Track& tt_j,
                          const ValidBounds& bounds,
                          const PairingParams& params) noexcept(false);

// Throws std::runtime_error if 'params' is out of range, or 'bounds' is unset
PairingResult find_pair_candidates(const TrackSet& track_set,
                                   const ValidBounds& bounds,
                                   const PairingParams& params) noexcept(false);

// Uses 'params.bounds'
PairingResult find_pair_candidates(const TrackSet& track_set,
                                   const PairingParams& params) noexcept(false);

} // namespace spindle
