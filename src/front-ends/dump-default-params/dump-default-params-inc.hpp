
#pragma once

namespace spindle::dump_default_params
{
inline string brief() noexcept
{
   return "dumps the default pairing 'params.json'.";
}

int run_main(int argc, char** argv);
} // namespace spindle::dump_default_params
