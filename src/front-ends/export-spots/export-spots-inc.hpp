
#pragma once

namespace spindle::export_spots
{
inline string brief() noexcept
{
   return "writes the spots of classified pairs to a csv file.";
}

int run_main(int argc, char** argv);
} // namespace spindle::export_spots
