
#include "feature-table.hpp"

#define This FeatureTable

namespace spindle
{
// ---------------------------------------------------------------- column-names
//
const vector<string>& This::column_names() noexcept
{
   static const vector<string> names{{"centID_i",
                                      "centID_j",
                                      "t_overlap",
                                      "sl_i",
                                      "sl_f",
                                      "sl_min",
                                      "sl_max",
                                      "center_stdev",
                                      "normal_stdev",
                                      "t_cong",
                                      "contrast",
                                      "intensity",
                                      "diameter"}};
   return names;
}

// ---------------------------------------------------------------------- to-csv
//
string This::to_csv() const noexcept
{
   std::stringstream ss{""};
   ss << implode(cbegin(column_names()), cend(column_names()), ",") << '\n';

   for(const auto& x : rows)
      ss << format("{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
                   x.centID_i,
                   x.centID_j,
                   x.t_overlap,
                   x.sl_i,
                   x.sl_f,
                   x.sl_min,
                   x.sl_max,
                   x.center_stdev,
                   x.normal_stdev,
                   x.t_cong,
                   x.contrast,
                   x.intensity,
                   x.diameter);

   return ss.str();
}

// ----------------------------------------------------------- min-max-normalize
//
void min_max_normalize(vector<real>& values) noexcept
{
   if(values.empty()) return;
   const auto [min_ii, max_ii] = std::minmax_element(begin(values), end(values));
   const real min_val          = *min_ii;
   const real range            = *max_ii - min_val;
   for(auto& x : values) x = (range > 0.0) ? (x - min_val) / range : 0.0;
}

// ---------------------------------------------------------- make-feature-table
//
FeatureTable make_feature_table(const vector<Cell>& cells) noexcept
{
   FeatureTable o;
   o.rows.resize(cells.size());

   vector<real> contrasts(cells.size());
   vector<real> intensities(cells.size());
   for(size_t i = 0; i < cells.size(); ++i) {
      contrasts[i]   = cells[i].contrast;
      intensities[i] = cells[i].intensity;
   }
   min_max_normalize(contrasts);
   min_max_normalize(intensities);

   for(size_t i = 0; i < cells.size(); ++i) {
      const auto& c = cells[i];
      auto& x       = o.rows[i];
      x.centID_i     = c.id_i;
      x.centID_j     = c.id_j;
      x.t_overlap    = c.t_overlap;
      x.sl_i         = c.sl_i;
      x.sl_f         = c.sl_f;
      x.sl_min       = c.sl_min;
      x.sl_max       = c.sl_max;
      x.center_stdev = c.center_stdev;
      x.normal_stdev = c.normal_stdev;
      x.t_cong       = c.t_cong;
      x.contrast     = contrasts[i];
      x.intensity    = intensities[i];
      x.diameter     = c.diameter;
   }

   return o;
}

} // namespace spindle
