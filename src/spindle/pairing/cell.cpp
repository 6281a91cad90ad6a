
#include "cell.hpp"

#include "congression.hpp"

#include "spindle/io/json-io.hpp"
#include "spindle/utils/math.hpp"

#include <Eigen/Dense>

#define This Cell

namespace spindle
{
// ------------------------------------------------------------------ operator==
//
bool This::operator==(const Cell& o) const noexcept
{
   auto eq = [](real a, real b) { return float_is_same(a, b); };
   return id_i == o.id_i and id_j == o.id_j and eq(t_overlap, o.t_overlap)
          and eq(sl_i, o.sl_i) and eq(sl_f, o.sl_f) and eq(sl_min, o.sl_min)
          and eq(sl_max, o.sl_max) and eq(center.x, o.center.x)
          and eq(center.y, o.center.y) and eq(center.z, o.center.z)
          and eq(center_stdev, o.center_stdev)
          and eq(normal_stdev, o.normal_stdev) and eq(t_cong, o.t_cong)
          and eq(contrast, o.contrast) and eq(intensity, o.intensity)
          and eq(diameter, o.diameter) and eq(dist2border, o.dist2border);
}

// ------------------------------------------------------------------- to-string
//
string This::to_string() const noexcept
{
   return format(R"V0G0N(
Cell [{}, {}]
   t-overlap:        {}
   sl (i, f):        [{}, {}]
   sl (min, max):    [{}, {}]
   center:           {}
   center-stdev:     {}
   normal-stdev:     {}
   t-cong:           {}
   contrast:         {}
   intensity:        {}
   diameter:         {}
   dist2border:      {}
)V0G0N",
                 id_i,
                 id_j,
                 t_overlap,
                 sl_i,
                 sl_f,
                 sl_min,
                 sl_max,
                 center.to_string(),
                 center_stdev,
                 normal_stdev,
                 t_cong,
                 contrast,
                 intensity,
                 diameter,
                 dist2border);
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["centID_i"]     = json_save(id_i);
   o["centID_j"]     = json_save(id_j);
   o["t_overlap"]    = json_save(t_overlap);
   o["sl_i"]         = json_save(sl_i);
   o["sl_f"]         = json_save(sl_f);
   o["sl_min"]       = json_save(sl_min);
   o["sl_max"]       = json_save(sl_max);
   o["center"]       = json_save(center);
   o["center_stdev"] = json_save(center_stdev);
   o["normal_stdev"] = json_save(normal_stdev);
   o["t_cong"]       = json_save(t_cong);
   o["contrast"]     = json_save(contrast);
   o["intensity"]    = json_save(intensity);
   o["diameter"]     = json_save(diameter);
   o["dist2border"]  = json_save(dist2border);
   return o;
}

// ---------------------------------------------------------------- spread-stdev
//
real spread_stdev(const vector<Vector3>& Xs) noexcept
{
   const auto N = Eigen::Index(Xs.size());
   if(N < 2) return dNAN;

   Eigen::MatrixX3d M(N, 3);
   for(auto i = 0; i < N; ++i) M.row(i) = Xs[size_t(i)].to_eigen().transpose();

   const Eigen::RowVector3d av = M.colwise().mean();
   M.rowwise() -= av;

   // Sum of the per-axis sample variances
   real var_sum = 0.0;
   for(auto c = 0; c < 3; ++c) var_sum += M.col(c).squaredNorm() / real(N - 1);
   return std::sqrt(var_sum);
}

// ------------------------------------------------------------------- make-cell
//
Cell make_cell(const Track& tt_i,
               const Track& tt_j,
               const PairSeries& series,
               const ValidBounds& bounds,
               const PairingParams& params) noexcept(false)
{
   if(series.size() < 2)
      throw std::runtime_error(
          format("cannot make cell [{}, {}] from {} samples",
                 tt_i.id,
                 tt_j.id,
                 series.size()));

   const auto& D = series.distances;

   Cell o;
   o.id_i      = std::min(tt_i.id, tt_j.id);
   o.id_j      = std::max(tt_i.id, tt_j.id);
   o.t_overlap = overlap_1d(tt_i.time_range(), tt_j.time_range()).length();

   o.sl_i   = D.front();
   o.sl_f   = D.back();
   o.sl_min = *std::min_element(cbegin(D), cend(D));
   o.sl_max = *std::max_element(cbegin(D), cend(D));

   Vector3 sum;
   for(const auto& X : series.centers) sum += X;
   o.center = sum / real(series.centers.size());

   o.center_stdev = spread_stdev(series.centers);
   o.normal_stdev = spread_stdev(series.normals);

   const int n_cong
       = congression_run_length(series.times, D, params.max_cong_dist);
   o.t_cong = real(n_cong) * params.frame_rate;

   o.contrast  = 0.5 * (tt_i.contrast + tt_j.contrast);
   o.intensity = 0.5 * (tt_i.intensity + tt_j.intensity);
   o.diameter  = 0.5 * (tt_i.diameter + tt_j.diameter);

   o.dist2border = bounds.distance_to_border(o.center.x, o.center.y);

   return o;
}

} // namespace spindle
