
#include "distance-tracker.hpp"

#include "spindle/geometry/line-1d.hpp"

namespace spindle
{
// ------------------------------------------------------------------- push-back
//
void PairSeries::push_back(int t,
                           const Vector3& p_i,
                           const Vector3& p_j) noexcept
{
   times.push_back(t);
   distances.push_back(distance(p_i, p_j));
   centers.push_back(midpoint(p_i, p_j));
   normals.push_back(normalize(p_i - p_j));
}

string PairSeries::to_string() const noexcept
{
   std::stringstream ss{""};
   ss << "[";
   for(size_t i = 0; i < size(); ++i)
      ss << format("{}{}: {:.3f}", (i == 0 ? "" : ", "), times[i], distances[i]);
   ss << "]";
   return ss.str();
}

// -------------------------------------------------------- track-pair-distances
//
std::optional<PairSeries> track_pair_distances(const TrackSet& track_set,
                                               const int id_i,
                                               const int id_j) noexcept(false)
{
   const Track* tt_i = track_set.track(id_i);
   const Track* tt_j = track_set.track(id_j);
   if(tt_i == nullptr or tt_j == nullptr)
      throw std::runtime_error(
          format("cannot track distances between unknown tracks {} and {}",
                 id_i,
                 id_j));

   const auto window = overlap_1d(tt_i->time_range(), tt_j->time_range());
   if(window.length() <= 0.0) return std::nullopt;

   PairSeries o;
   for(int t = int(std::ceil(window.a)); real(t) < window.b; ++t) {
      const Spot* s_i = track_set.spot_at(id_i, t);
      const Spot* s_j = track_set.spot_at(id_j, t);
      if(s_i == nullptr or s_j == nullptr) continue; // sampling gap
      o.push_back(t, s_i->position, s_j->position);
   }

   return o;
}

} // namespace spindle
