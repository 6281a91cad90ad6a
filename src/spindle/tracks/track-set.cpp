
#include "track-set.hpp"

#include "spindle/io/json-io.hpp"
#include "spindle/utils/file-system.hpp"
#include "spindle/utils/math.hpp"

#define This TrackSet

namespace spindle
{
// ------------------------------------------------------- summarize photometrics
// Averages every spot visited at integer frames in [start, stop]
static void summarize_photometrics(const TrackSet& track_set,
                                   Track& tt) noexcept
{
   real diameter = 0.0, contrast = 0.0, intensity = 0.0;
   int counter   = 0;
   for(int t = tt.first_frame(); real(t) <= tt.stop; ++t) {
      const Spot* spot = track_set.spot_at(tt.id, t);
      if(spot == nullptr) continue;
      diameter += spot->diameter;
      contrast += spot->contrast;
      intensity += spot->max_intensity;
      ++counter;
   }

   if(counter == 0) {
      tt.diameter = tt.contrast = tt.intensity = 0.0;
   } else {
      tt.diameter  = diameter / real(counter);
      tt.contrast  = contrast / real(counter);
      tt.intensity = intensity / real(counter);
   }
}

// ------------------------------------------------------------------------ make
//
TrackSet This::make(const vector<Spot>& spots,
                    const vector<Track>& tracks,
                    const vector<Edge>& edges) noexcept(false)
{
   TrackSet o;

   o.spots_.reserve(spots.size());
   for(const auto& spot : spots) {
      if(!o.spots_.insert({spot.id, spot}).second)
         throw std::runtime_error(format("duplicate spot id {}", spot.id));
   }

   for(const auto& tt : tracks) {
      if(tt.start > tt.stop)
         throw std::runtime_error(format("track #{} starts after it stops",
                                         tt.id));
      if(!o.tracks_.insert({tt.id, tt}).second)
         throw std::runtime_error(format("duplicate track id {}", tt.id));
      o.time_maps_[tt.id]; // every track has a (possibly empty) time map
   }

   // Later edges at the same frame replace earlier ones
   for(const auto& e : edges) {
      if(o.tracks_.count(e.track_id) == 0)
         throw std::runtime_error(
             format("{} refers to unknown track", e.to_string()));
      if(o.spots_.count(e.source) == 0)
         throw std::runtime_error(
             format("{} refers to unknown source spot", e.to_string()));
      o.time_maps_[e.track_id][e.frame()] = e.source;
   }
   o.edges_ = edges;

   for(auto& [id, tt] : o.tracks_) summarize_photometrics(o, tt);

   return o;
}

// --------------------------------------------------------------------- getters
//
const Spot* This::spot(int spot_id) const noexcept
{
   auto ii = spots_.find(spot_id);
   return (ii == cend(spots_)) ? nullptr : &ii->second;
}

const Track* This::track(int track_id) const noexcept
{
   auto ii = tracks_.find(track_id);
   return (ii == cend(tracks_)) ? nullptr : &ii->second;
}

const TrackSet::TimeMap* This::time_map(int track_id) const noexcept
{
   auto ii = time_maps_.find(track_id);
   return (ii == cend(time_maps_)) ? nullptr : &ii->second;
}

const Spot* This::spot_at(int track_id, int t) const noexcept
{
   const TimeMap* tmap = time_map(track_id);
   if(tmap == nullptr) return nullptr;
   auto ii = tmap->find(t);
   return (ii == cend(*tmap)) ? nullptr : spot(ii->second);
}

vector<Spot> This::sorted_spots() const noexcept
{
   vector<Spot> out;
   out.reserve(spots_.size());
   for(const auto& [id, spot] : spots_) out.push_back(spot);
   std::sort(begin(out), end(out), [](const auto& a, const auto& b) {
      return a.id < b.id;
   });
   return out;
}

// ------------------------------------------------------------------ brief-info
//
string This::brief_info() const noexcept
{
   return format(
       "{} spots, {} tracks, {} edges", n_spots(), n_tracks(), n_edges());
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept
{
   const auto spots = sorted_spots();
   vector<Track> tracks;
   tracks.reserve(tracks_.size());
   for(const auto& [id, tt] : tracks_) tracks.push_back(tt);

   Json::Value o{Json::objectValue};
   o["spots"] = json_save_t(cbegin(spots), cend(spots), [](const Spot& x) {
      return x.to_json();
   });
   o["tracks"] = json_save_t(cbegin(tracks), cend(tracks), [](const Track& x) {
      return x.to_json();
   });
   o["edges"] = json_save_t(cbegin(edges_), cend(edges_), [](const Edge& x) {
      return x.to_json();
   });
   return o;
}

// -------------------------------------------------------------- read-track-set
//
TrackSet read_track_set(const Json::Value& o) noexcept(false)
{
   auto read_array = [&](const char* key, auto& out) {
      using T = typename std::decay_t<decltype(out)>::value_type;
      try {
         json_load_t<T>(get_key(o, key),
                        out,
                        [](const Json::Value& node, T& x) { x.read(node); });
      } catch(std::runtime_error& e) {
         throw std::runtime_error(
             format("error reading '{}' of track-set: {}", key, e.what()));
      }
   };

   vector<Spot> spots;
   vector<Track> tracks;
   vector<Edge> edges;
   read_array("spots", spots);
   read_array("tracks", tracks);
   read_array("edges", edges);

   return TrackSet::make(spots, tracks, edges);
}

TrackSet load_track_set(const string_view fname) noexcept(false)
{
   try {
      return read_track_set(parse_json(file_get_contents(fname)));
   } catch(std::system_error& e) {
      throw std::runtime_error(
          format("failed to read track-set file '{}': {}", fname, e.what()));
   }
}

void save_track_set(const TrackSet& track_set,
                    const string_view fname) noexcept(false)
{
   const auto ec = file_put_contents(fname, str(track_set.to_json()));
   if(ec)
      throw std::runtime_error(format(
          "failed to write track-set file '{}': {}", fname, ec.message()));
}

} // namespace spindle
