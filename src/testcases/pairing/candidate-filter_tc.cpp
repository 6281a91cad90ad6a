
#include <algorithm>
#include <iterator>
#include <random>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/pairing/candidate-filter.hpp"
#include "testcases/test-track-sets.hpp"

static const bool feedback = false;

namespace spindle
{
using namespace spindle::testing;

static PairingParams test_params()
{
   PairingParams p;
   p.bounds = test_bounds();
   return p;
}

static TestTrack still_track(int id, real start, real stop, Vector3 X)
{
   TestTrack tt;
   tt.id       = id;
   tt.start    = start;
   tt.stop     = stop;
   tt.mean     = X;
   tt.position = [X](int) { return X; };
   return tt;
}

// Tracks wandering about the frame
static TrackSet make_random_scene(unsigned seed, int n_tracks)
{
   std::mt19937 g;
   g.seed(seed);
   std::uniform_real_distribution<real> pos(5.0, 95.0);
   std::uniform_real_distribution<real> jitter(-1.5, 1.5);
   std::uniform_int_distribution<int> start(0, 30);
   std::uniform_int_distribution<int> length(3, 40);
   std::uniform_int_distribution<int> coin(0, 9);

   // Half the tracks are placed near an earlier track
   vector<TestTrack> descs;
   for(auto i = 0; i < n_tracks; ++i) {
      Vector3 C(pos(g), pos(g), 0.0);
      if(i > 0 and coin(g) < 5) {
         const auto& other = descs[size_t(g() % unsigned(i))];
         C = other.mean + Vector3(jitter(g) * 4.0, jitter(g) * 4.0, 0.0);
      }

      vector<Vector3> path;
      for(auto t = 0; t < 80; ++t)
         path.push_back(C + Vector3(jitter(g), jitter(g), jitter(g)));

      TestTrack tt;
      tt.id        = 100 - i; // ids not in insertion order
      tt.start     = real(start(g));
      tt.stop      = tt.start + real(length(g));
      tt.mean      = C;
      tt.position  = [path](int t) { return path[size_t(t)]; };
      tt.contrast  = real(coin(g)) * 0.1;
      tt.intensity = 100.0 + real(coin(g));
      for(auto t = int(tt.start); t < int(tt.stop); ++t)
         if(coin(g) == 0) tt.gaps.push_back(t);
      descs.push_back(tt);
   }

   return make_test_track_set(descs);
}

static bool contains(const vector<Rejection>& xs, const Rejection& x)
{
   return std::find(cbegin(xs), cend(xs), x) != cend(xs);
}

static const Cell* find_cell(const vector<Cell>& cells, int id_i, int id_j)
{
   auto ii = std::find_if(cbegin(cells), cend(cells), [&](const auto& c) {
      return c.id_i == id_i and c.id_j == id_j;
   });
   return (ii == cend(cells)) ? nullptr : &*ii;
}

CATCH_TEST_CASE("FindPairCandidates", "[candidate-filter]")
{
   CATCH_SECTION("candidate-filter-short-overlap")
   {
      const Vector3 X(50.0, 50.0, 0.0);
      const auto ts = make_test_track_set(
          {still_track(1, 0.0, 5.0, X), still_track(2, 3.0, 10.0, X)});

      auto params        = test_params();
      params.min_overlap = 3.0;

      const auto ret = find_pair_candidates(ts, params);
      CATCH_REQUIRE(ret.cells.empty());
      CATCH_REQUIRE(ret.pairable_tracks == vector<int>{1, 2});
      CATCH_REQUIRE(ret.rejections.size() == 1);
      CATCH_REQUIRE(ret.rejections[0]
                    == Rejection{1, 2, RejectReason::OVERLAP_TOO_SHORT});
      CATCH_REQUIRE(ret.rejection_log()
                    == "1 and 2 not pair: overlap time too short\n");

      // Frames 3 and 4 are common to both
      params.min_overlap = 2.0;
      const auto relaxed = find_pair_candidates(ts, params);
      CATCH_REQUIRE(relaxed.rejections.empty());
      CATCH_REQUIRE(relaxed.cells.size() == 1);
      CATCH_REQUIRE(relaxed.cells[0].t_overlap == Approx(2.0));
   }

   CATCH_SECTION("candidate-filter-border")
   {
      const auto ts = make_test_track_set(
          {still_track(1, 0.0, 20.0, Vector3(0.0, 50.0, 0.0)),   // left
           still_track(2, 0.0, 20.0, Vector3(50.0, 100.0, 0.0)), // bottom
           still_track(3, 0.0, 20.0, Vector3(50.0, 50.0, 0.0)),
           still_track(4, 0.0, 20.0, Vector3(-3.0, 50.0, 0.0)),  // outside
           still_track(5, 0.0, 4.0, Vector3(50.0, 50.0, 0.0))}); // short

      vector<Rejection> rejections;
      const auto ids = select_pairable_tracks(
          ts, test_bounds(), test_params(), &rejections);
      CATCH_REQUIRE(ids == vector<int>{3});
      CATCH_REQUIRE(rejections.size() == 4);
      CATCH_REQUIRE(rejections[0]
                    == Rejection{1, -1, RejectReason::OUTSIDE_BORDER});
      CATCH_REQUIRE(rejections[1]
                    == Rejection{2, -1, RejectReason::OUTSIDE_BORDER});
      CATCH_REQUIRE(rejections[2]
                    == Rejection{4, -1, RejectReason::OUTSIDE_BORDER});
      CATCH_REQUIRE(rejections[3]
                    == Rejection{5, -1, RejectReason::SHORT_DURATION});
      CATCH_REQUIRE(rejections[0].to_string()
                    == "1 not included: outside border");
      CATCH_REQUIRE(rejections[3].to_string()
                    == "5 not included: duration less than min_overlap");
   }

   CATCH_SECTION("candidate-filter-one-canonical-cell")
   {
      const auto ts = make_test_track_set(make_test_pair(5, 2, 0.0, 20.0, 2.0));

      auto params       = test_params();
      params.frame_rate = 1.5;

      const auto ret = find_pair_candidates(ts, params);
      CATCH_REQUIRE(ret.rejections.empty());
      CATCH_REQUIRE(ret.cells.size() == 1);

      const auto& c = ret.cells[0];
      if(feedback) INFO(str(c));
      CATCH_REQUIRE(c.id_i == 2);
      CATCH_REQUIRE(c.id_j == 5);
      CATCH_REQUIRE(c.t_overlap == Approx(20.0));
      CATCH_REQUIRE(c.sl_i == Approx(2.0));
      CATCH_REQUIRE(c.sl_f == Approx(2.0));
      CATCH_REQUIRE(c.sl_min == Approx(2.0));
      CATCH_REQUIRE(c.sl_max == Approx(2.0));
      CATCH_REQUIRE(c.center.x == Approx(50.0));
      CATCH_REQUIRE(c.center.y == Approx(50.0));
      CATCH_REQUIRE(c.center_stdev == Approx(0.0));
      CATCH_REQUIRE(c.normal_stdev == Approx(0.0));
      CATCH_REQUIRE(c.t_cong == Approx(20 * 1.5)); // frames [0, 20)
      CATCH_REQUIRE(c.contrast == Approx(0.5));
      CATCH_REQUIRE(c.intensity == Approx(100.0));
      CATCH_REQUIRE(c.diameter == Approx(1.0));
      CATCH_REQUIRE(c.dist2border == Approx(50.0));

      // Evaluating the mirror pair directly is silent
      const auto& tt_2 = *ts.track(2);
      const auto& tt_5 = *ts.track(5);
      CATCH_REQUIRE(
          evaluate_pair(ts, tt_5, tt_2, test_bounds(), params).is_skipped());
      CATCH_REQUIRE(
          evaluate_pair(ts, tt_2, tt_2, test_bounds(), params).is_skipped());
      CATCH_REQUIRE(
          evaluate_pair(ts, tt_2, tt_5, test_bounds(), params).cell.has_value());
   }

   CATCH_SECTION("candidate-filter-distance-stages")
   {
      vector<TestTrack> descs;
      auto push = [&](vector<TestTrack> xs) {
         descs.insert(end(descs), begin(xs), end(xs));
      };
      push(make_test_pair(1, 2, 0.0, 20.0, 12.0)); // mean too far
      push(make_test_pair(3, 4, 0.0, 20.0, 6.0));  // never close enough
      push(make_test_pair(5, 6, 0.0, 20.0, 3.0));  // accepted

      // Only one common sample
      TestTrack a = still_track(7, 0.0, 12.0, Vector3(20.0, 20.0, 0.0));
      TestTrack b = still_track(8, 0.0, 12.0, Vector3(21.0, 20.0, 0.0));
      for(auto t = 1; t < 12; ++t) b.gaps.push_back(t);
      descs.push_back(a);
      descs.push_back(b);

      // Move each pair far from the others
      for(size_t i = 0; i < 6; ++i) {
         const Vector3 dX(0.0, -30.0 + 20.0 * real(i / 2), 0.0);
         const auto X = descs[i].mean + dX;
         descs[i].mean     = X;
         descs[i].position = [X](int) { return X; };
      }

      const auto ts  = make_test_track_set(descs);
      const auto ret = find_pair_candidates(ts, test_params());
      CATCH_REQUIRE(ret.cells.size() == 1);
      CATCH_REQUIRE(ret.cells[0].id_i == 5);
      CATCH_REQUIRE(ret.cells[0].id_j == 6);
      CATCH_REQUIRE(contains(ret.rejections,
                             Rejection{1, 2, RejectReason::TOO_FAR_MEAN}));
      CATCH_REQUIRE(contains(ret.rejections,
                             Rejection{3, 4, RejectReason::TOO_FAR_MIN}));
      CATCH_REQUIRE(contains(ret.rejections,
                             Rejection{7, 8, RejectReason::TOO_FEW_SAMPLES}));

      const auto log = ret.rejection_log();
      CATCH_REQUIRE(log.find("1 and 2 not pair: too far away\n")
                    != string::npos);
      CATCH_REQUIRE(
          log.find("3 and 4 not pair: too far away (min distance filter)\n")
          != string::npos);
      CATCH_REQUIRE(log.find("7 and 8 not pair: overlap time too short (<2)\n")
                    != string::npos);

      // No pair is evaluated twice
      for(const auto& x : ret.rejections)
         if(!x.is_track_rejection()) CATCH_REQUIRE(x.id_i < x.id_j);
   }

   CATCH_SECTION("candidate-filter-non-finite-distance")
   {
      // A NAN position at a single frame poisons the mean distance
      auto descs = make_test_pair(1, 2, 0.0, 20.0, 2.0);
      const auto X = descs[0].mean;
      descs[0].position = [X](int t) { return (t == 7) ? Vector3::nan() : X; };
      const auto ts = make_test_track_set(descs);

      const auto ret = find_pair_candidates(ts, test_params());
      CATCH_REQUIRE(ret.cells.empty());
      CATCH_REQUIRE(ret.rejections
                    == vector<Rejection>{
                        Rejection{1, 2, RejectReason::TOO_FAR_MEAN}});
   }

   CATCH_SECTION("candidate-filter-configuration-errors")
   {
      const auto ts = make_test_track_set(make_test_pair(1, 2, 0.0, 20.0, 2.0));

      PairingParams no_bounds;
      CATCH_REQUIRE_THROWS_AS(find_pair_candidates(ts, no_bounds),
                              std::runtime_error);

      auto bad_overlap        = test_params();
      bad_overlap.min_overlap = 0.0;
      CATCH_REQUIRE_THROWS_AS(find_pair_candidates(ts, bad_overlap),
                              std::runtime_error);

      auto inverted   = test_params();
      inverted.bounds = ValidBounds(100.0, 0.0, 0.0, 100.0);
      CATCH_REQUIRE_THROWS_AS(find_pair_candidates(ts, inverted),
                              std::runtime_error);
   }

   CATCH_SECTION("candidate-filter-parallel-equals-serial")
   {
      for(auto seed = 1u; seed <= 4u; ++seed) {
         const auto ts = make_random_scene(seed, 40);

         auto params     = test_params();
         params.parallel = false;
         const auto A    = find_pair_candidates(ts, params);
         params.parallel = true;
         const auto B    = find_pair_candidates(ts, params);

         if(feedback) INFO(A.brief_info());
         CATCH_REQUIRE(A.pairable_tracks == B.pairable_tracks);
         CATCH_REQUIRE(A.cells == B.cells);
         CATCH_REQUIRE(A.rejections == B.rejections);

         // Cells are canonical, unique, and ordered
         for(size_t i = 0; i < A.cells.size(); ++i) {
            CATCH_REQUIRE(A.cells[i].id_i < A.cells[i].id_j);
            if(i > 0) {
               const auto& p = A.cells[i - 1];
               const auto& c = A.cells[i];
               CATCH_REQUIRE(std::make_pair(p.id_i, p.id_j)
                             < std::make_pair(c.id_i, c.id_j));
            }
            CATCH_REQUIRE(A.cells[i].sl_min <= A.cells[i].sl_i);
            CATCH_REQUIRE(A.cells[i].sl_min <= A.cells[i].sl_f);
            CATCH_REQUIRE(A.cells[i].sl_max >= A.cells[i].sl_i);
            CATCH_REQUIRE(A.cells[i].sl_max >= A.cells[i].sl_f);
         }
      }
   }

   CATCH_SECTION("candidate-filter-monotonic")
   {
      for(auto seed = 11u; seed <= 14u; ++seed) {
         const auto ts   = make_random_scene(seed, 30);
         const auto base = test_params();
         const auto A    = find_pair_candidates(ts, base);

         // Pairs of tracks that survived the whole-track filter of 'A'
         auto was_pairable = [&](int id_i, int id_j) {
            const auto& ids = A.pairable_tracks;
            return std::binary_search(cbegin(ids), cend(ids), id_i)
                   and std::binary_search(cbegin(ids), cend(ids), id_j);
         };

         // Relaxing one threshold only admits pairs rejected at its stage
         auto check_relaxed = [&](const PairingParams& relaxed,
                                  RejectReason stage) {
            const auto B = find_pair_candidates(ts, relaxed);
            for(const auto& c : A.cells)
               CATCH_REQUIRE(find_cell(B.cells, c.id_i, c.id_j) != nullptr);
            for(const auto& c : B.cells)
               if(was_pairable(c.id_i, c.id_j)
                  and find_cell(A.cells, c.id_i, c.id_j) == nullptr)
                  CATCH_REQUIRE(
                      contains(A.rejections, Rejection{c.id_i, c.id_j, stage}));
            for(const auto& x : B.rejections) {
               if(x.is_track_rejection()) continue;
               if(!was_pairable(x.id_i, x.id_j)) continue;
               const bool same = contains(A.rejections, x);
               const bool at_stage
                   = contains(A.rejections, Rejection{x.id_i, x.id_j, stage});
               CATCH_REQUIRE((same or at_stage));
            }
         };

         auto p0     = base;
         p0.max_dist = base.max_dist + 5.0;
         check_relaxed(p0, RejectReason::TOO_FAR_MEAN);

         auto p1     = base;
         p1.min_dist = base.min_dist + 2.0;
         check_relaxed(p1, RejectReason::TOO_FAR_MIN);

         auto p2        = base;
         p2.min_overlap = 4.0;
         check_relaxed(p2, RejectReason::OVERLAP_TOO_SHORT);
      }
   }
}

} // namespace spindle
