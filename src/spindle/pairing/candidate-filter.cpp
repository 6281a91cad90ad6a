
#include "candidate-filter.hpp"

#include "spindle/utils/math.hpp"
#include "spindle/utils/threads.hpp"

namespace spindle
{
// ---------------------------------------------------------------- RejectReason
//
const char* str(const RejectReason x) noexcept
{
   switch(x) {
   case RejectReason::OUTSIDE_BORDER: return "outside border";
   case RejectReason::SHORT_DURATION:
      return "duration less than min_overlap";
   case RejectReason::OVERLAP_TOO_SHORT: return "overlap time too short";
   case RejectReason::TOO_FEW_SAMPLES: return "overlap time too short (<2)";
   case RejectReason::TOO_FAR_MEAN: return "too far away";
   case RejectReason::TOO_FAR_MIN: return "too far away (min distance filter)";
   }
   return "<unknown>";
}

// ------------------------------------------------------------------- Rejection
//
string Rejection::to_string() const noexcept
{
   if(is_track_rejection())
      return format("{} not included: {}", id_i, str(reason));
   return format("{} and {} not pair: {}", id_i, id_j, str(reason));
}

// --------------------------------------------------------------- PairingResult
//
string PairingResult::rejection_log() const noexcept
{
   std::stringstream ss{""};
   for(const auto& x : rejections) ss << x.to_string() << '\n';
   return ss.str();
}

string PairingResult::brief_info() const noexcept
{
   const auto n_track_rejects
       = std::count_if(cbegin(rejections), cend(rejections), [](const auto& x) {
            return x.is_track_rejection();
         });
   return format("pairable-tracks = {}, cells = {}, rejected tracks = {}, "
                 "rejected pairs = {}",
                 pairable_tracks.size(),
                 cells.size(),
                 n_track_rejects,
                 rejections.size() - size_t(n_track_rejects));
}

// ------------------------------------------------------ select-pairable-tracks
//
vector<int> select_pairable_tracks(const TrackSet& track_set,
                                   const ValidBounds& bounds,
                                   const PairingParams& params,
                                   vector<Rejection>* rejections) noexcept
{
   vector<int> o;
   o.reserve(track_set.n_tracks());

   auto reject = [&](int id, RejectReason reason) {
      Rejection x{id, -1, reason};
      TRACE(x.to_string());
      if(rejections != nullptr) rejections->push_back(x);
   };

   for(const auto& [id, tt] : track_set.tracks()) {
      const auto dist
          = bounds.distance_to_border(tt.position.x, tt.position.y);
      if(!(dist > 0.0)) // on, or outside, the border
         reject(id, RejectReason::OUTSIDE_BORDER);
      else if(tt.duration < params.min_overlap)
         reject(id, RejectReason::SHORT_DURATION);
      else
         o.push_back(id);
   }

   return o;
}

// --------------------------------------------------------------- evaluate-pair
//
PairOutcome evaluate_pair(const TrackSet& track_set,
                          const Track& tt_i,
                          const Track& tt_j,
                          const ValidBounds& bounds,
                          const PairingParams& params) noexcept(false)
{
   PairOutcome o;

   auto reject = [&](RejectReason reason) {
      o.rejection = Rejection{tt_i.id, tt_j.id, reason};
      return o;
   };

   // Stages 1 and 2 are silent
   if(tt_j.duration < params.min_overlap) return o;
   if(tt_i.id == tt_j.id) return o;
   if(tt_i.id > tt_j.id) return o; // the mirror pair gives the same cell

   // Stage 3
   const auto overlap = overlap_1d(tt_i.time_range(), tt_j.time_range());
   if(overlap.length() < params.min_overlap)
      return reject(RejectReason::OVERLAP_TOO_SHORT);

   // Stage 4
   const auto series = track_pair_distances(track_set, tt_i.id, tt_j.id);
   if(!series or series->size() < 2)
      return reject(RejectReason::TOO_FEW_SAMPLES);

   // Stage 5. Written so that a NAN distance is rejected
   const auto& D = series->distances;
   if(!(calc_average(cbegin(D), cend(D)) <= params.max_dist))
      return reject(RejectReason::TOO_FAR_MEAN);

   // Stage 6
   if(!(*std::min_element(cbegin(D), cend(D)) <= params.min_dist))
      return reject(RejectReason::TOO_FAR_MIN);

   o.cell = make_cell(tt_i, tt_j, *series, bounds, params);
   return o;
}

// -------------------------------------------------------- find-pair-candidates
//
PairingResult find_pair_candidates(const TrackSet& track_set,
                                   const ValidBounds& bounds,
                                   const PairingParams& params) noexcept(false)
{
   params.validate();

   if(!bounds.is_set())
      throw std::runtime_error(
          "valid-pixel bounds are not set: cannot apply the border filter");
   if(!bounds.is_valid())
      throw std::runtime_error(format("invalid valid-pixel bounds: {}",
                                      bounds.to_json_string()));

   PairingResult ret;
   ret.pairable_tracks
       = select_pairable_tracks(track_set, bounds, params, &ret.rejections);

   const auto& ids = ret.pairable_tracks;
   const auto N    = ids.size();

   // One slot per outer track
   vector<vector<PairOutcome>> slots(N);

   auto process_i = [&](size_t i) {
      const Track* tt_i = track_set.track(ids[i]);
      Expects(tt_i != nullptr);
      auto& slot = slots[i];
      for(size_t j = 0; j < N; ++j) {
         const Track* tt_j = track_set.track(ids[j]);
         Expects(tt_j != nullptr);
         auto outcome = evaluate_pair(track_set, *tt_i, *tt_j, bounds, params);
         if(!outcome.is_skipped()) slot.push_back(std::move(outcome));
      }
   };

   ParallelJobSet pjobs;
   pjobs.reserve(N);
   for(size_t i = 0; i < N; ++i)
      pjobs.schedule([&process_i, i]() { process_i(i); });
   if(params.parallel)
      pjobs.execute();
   else
      pjobs.execute_non_parallel();

   // Merge in id order
   for(auto& slot : slots) {
      for(auto& outcome : slot) {
         if(outcome.rejection) {
            TRACE(outcome.rejection->to_string());
            ret.rejections.push_back(*outcome.rejection);
         }
         if(outcome.cell) ret.cells.push_back(std::move(*outcome.cell));
      }
   }

   return ret;
}

PairingResult find_pair_candidates(const TrackSet& track_set,
                                   const PairingParams& params) noexcept(false)
{
   return find_pair_candidates(track_set, params.bounds, params);
}

} // namespace spindle
