
#pragma once

#include "cell.hpp"

namespace spindle
{
struct FeatureRow
{
   int centID_i      = -1;
   int centID_j      = -1;
   real t_overlap    = 0.0;
   real sl_i         = 0.0;
   real sl_f         = 0.0;
   real sl_min       = 0.0;
   real sl_max       = 0.0;
   real center_stdev = 0.0;
   real normal_stdev = 0.0;
   real t_cong       = 0.0;
   real contrast     = 0.0; // min-max normalized within the table
   real intensity    = 0.0; // min-max normalized within the table
   real diameter     = 0.0;
};

struct FeatureTable
{
   vector<FeatureRow> rows;

   size_t size() const noexcept { return rows.size(); }
   bool empty() const noexcept { return rows.empty(); }

   static const vector<string>& column_names() noexcept;

   // Header line, then one line per row
   string to_csv() const noexcept;
};

// Scales 'values' into [0, 1]. If every value is the same (including a
// single value) then every value becomes 0.
void min_max_normalize(vector<real>& values) noexcept;

// One row per cell, in the same order
FeatureTable make_feature_table(const vector<Cell>& cells) noexcept;

} // namespace spindle
