
#pragma once

namespace spindle::pair_tracks
{
inline string brief() noexcept
{
   return "finds candidate spindle pairs, and writes their feature table.";
}

int run_main(int argc, char** argv);
} // namespace spindle::pair_tracks
