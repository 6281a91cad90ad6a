
#include "spot-export.hpp"

#include "spindle/utils/math.hpp"

#include <limits>

namespace spindle
{
// --------------------------------------------------------- read-accepted-pairs
//
vector<TrackPair> read_accepted_pairs(const string_view csv) noexcept(false)
{
   vector<string> lines = explode(csv, "\n", true);
   for(auto& line : lines) trim(line);
   lines.erase(std::remove_if(begin(lines),
                              end(lines),
                              [](const auto& s) { return s.empty(); }),
               end(lines));

   if(lines.empty())
      throw std::runtime_error("predictions file is empty: expected a header");

   const auto header = explode(lines.front(), ",");
   auto find_column  = [&](const string_view name) -> size_t {
      for(size_t i = 0; i < header.size(); ++i)
         if(trim_copy(header[i]) == name) return i;
      throw std::runtime_error(
          format("predictions file is missing the column '{}'", name));
   };

   const size_t col_i     = find_column("centID_i");
   const size_t col_j     = find_column("centID_j");
   const size_t col_label = find_column("Predicted_Label");

   // Values may be written as integers or reals (eg, "3.0")
   auto read_number = [&](const vector<string>& row,
                          size_t col,
                          size_t lineno) -> real {
      real value = dNAN;
      if(col >= row.size() or lexical_cast(trim_copy(row[col]), value)
         or !std::isfinite(value))
         throw std::runtime_error(
             format("predictions file, line {}: failed to read column '{}'",
                    lineno + 1,
                    header[col]));
      return value;
   };

   auto read_id = [&](const vector<string>& row,
                      size_t col,
                      size_t lineno) -> int {
      const real value = read_number(row, col, lineno);
      if(value < real(std::numeric_limits<int>::lowest())
         or value > real(std::numeric_limits<int>::max())
         or std::trunc(value) != value)
         throw std::runtime_error(
             format("predictions file, line {}: column '{}' is not a track "
                    "id: {}",
                    lineno + 1,
                    header[col],
                    value));
      return int(value);
   };

   vector<TrackPair> o;
   for(size_t n = 1; n < lines.size(); ++n) {
      const auto row = explode(lines[n], ",");
      if(read_number(row, col_label, n) != 1.0) continue;

      const TrackPair pair{read_id(row, col_i, n), read_id(row, col_j, n)};
      const TrackPair mirror{pair.id_j, pair.id_i};
      const bool seen = std::any_of(cbegin(o), cend(o), [&](const auto& x) {
         return x == pair or x == mirror;
      });
      if(!seen) o.push_back(pair);
   }

   return o;
}

// ------------------------------------------------------------ link-track-spots
//
vector<int> link_track_spots(const TrackSet& track_set,
                             const int track_id) noexcept(false)
{
   const Track* tt = track_set.track(track_id);
   if(tt == nullptr)
      throw std::runtime_error(format("unknown track id {}", track_id));

   vector<int> o;
   for(int t = tt->first_frame(); real(t) < tt->stop; ++t) {
      const Spot* spot = track_set.spot_at(track_id, t);
      if(spot != nullptr) o.push_back(spot->id);
   }
   return o;
}

// ---------------------------------------------------------------- column-names
//
const vector<string>& SpotExport::column_names() noexcept
{
   static const vector<string> names{{"Label",
                                      "ID",
                                      "TRACK_ID",
                                      "POSITION_X",
                                      "POSITION_Y",
                                      "POSITION_Z",
                                      "POSITION_T",
                                      "ESTIMATED_DIAMETER",
                                      "MAX_INTENSITY",
                                      "CONTRAST"}};
   return names;
}

// ---------------------------------------------------------------------- to-csv
//
string SpotExport::to_csv() const noexcept
{
   std::stringstream ss{""};
   ss << implode(cbegin(column_names()), cend(column_names()), ",") << '\n';
   for(const auto& row : rows) {
      const auto& s = row.spot;
      ss << format("{},{},{},{},{},{},{},{},{},{}\n",
                   row.label,
                   s.id,
                   row.track_id,
                   s.position.x,
                   s.position.y,
                   s.position.z,
                   s.t,
                   s.diameter,
                   s.max_intensity,
                   s.contrast);
   }
   return ss.str();
}

// ------------------------------------------------------------ make-spot-export
//
SpotExport make_spot_export(const TrackSet& track_set,
                            const vector<TrackPair>& pairs) noexcept(false)
{
   SpotExport o;

   auto push_track = [&](int track_id, const string& label) {
      for(const auto spot_id : link_track_spots(track_set, track_id)) {
         const Spot* spot = track_set.spot(spot_id);
         Expects(spot != nullptr); // TrackSet::make checks edge sources
         o.rows.push_back({label, track_id, *spot});
      }
   };

   int counter = 0;
   for(const auto& pair : pairs) {
      ++counter;
      push_track(pair.id_i, format("Cent_{}a", counter));
      push_track(pair.id_j, format("Cent_{}b", counter));
   }

   if(pairs.empty()) WARN("no accepted pairs: the spot export is empty");

   return o;
}

// ---------------------------------------------------------------- column-names
//
const vector<string>& CellCoords::column_names() noexcept
{
   static const vector<string> names{{"Cell", "Frame", "X", "Y", "Z"}};
   return names;
}

// ---------------------------------------------------------------------- to-tsv
//
string CellCoords::to_tsv() const noexcept
{
   std::stringstream ss{""};
   ss << implode(cbegin(column_names()), cend(column_names()), "\t") << '\n';
   for(const auto& row : rows)
      ss << format("{}\t{}\t{}\t{}\t{}\n",
                   row.cell,
                   row.frame,
                   row.X.x,
                   row.X.y,
                   row.X.z);
   return ss.str();
}

// -------------------------------------------------------------------- cell-ids
//
vector<string> CellCoords::cell_ids() const noexcept
{
   vector<string> o;
   for(const auto& row : rows)
      if(o.empty() or o.back() != row.cell) o.push_back(row.cell);
   return o;
}

string CellCoords::cell_ids_text() const noexcept
{
   std::stringstream ss{""};
   for(const auto& id : cell_ids()) ss << id << '\n';
   return ss.str();
}

// ------------------------------------------------------------ make-cell-coords
//
CellCoords make_cell_coords(const TrackSet& track_set,
                            const vector<TrackPair>& pairs) noexcept(false)
{
   CellCoords o;

   auto get_track = [&](int track_id) -> const Track& {
      const Track* tt = track_set.track(track_id);
      if(tt == nullptr)
         throw std::runtime_error(format("unknown track id {}", track_id));
      return *tt;
   };

   int counter = 0;
   for(const auto& pair : pairs) {
      const string label = format("Cell_{}", ++counter);
      const Track& tt_a  = get_track(pair.id_i);
      const Track& tt_b  = get_track(pair.id_j);

      // Frames shared by the two exports of 'make_spot_export'
      const int t0 = std::max(tt_a.first_frame(), tt_b.first_frame());
      for(int t = t0; real(t) < tt_a.stop and real(t) < tt_b.stop; ++t) {
         const Spot* a = track_set.spot_at(pair.id_i, t);
         const Spot* b = track_set.spot_at(pair.id_j, t);
         if(a == nullptr or b == nullptr) continue;
         o.rows.push_back({label, t, midpoint(a->position, b->position)});
      }

      if(o.rows.empty() or o.rows.back().cell != label)
         WARN(format("{} (tracks {} and {}) share no frame with spots",
                     label,
                     pair.id_i,
                     pair.id_j));
   }

   return o;
}

} // namespace spindle
