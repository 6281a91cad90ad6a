
#pragma once

namespace spindle::find_bounds
{
inline string brief() noexcept
{
   return "finds the valid-pixel bounds of a registered movie.";
}

int run_main(int argc, char** argv);
} // namespace spindle::find_bounds
