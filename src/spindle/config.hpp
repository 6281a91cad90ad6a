
#pragma once

#include <string>

namespace spindle
{
#ifdef TESTCASE_BUILD
constexpr bool k_is_testcase_build = true;
#else
constexpr bool k_is_testcase_build = false;
#endif

constexpr bool k_is_cli_build = !k_is_testcase_build;

#ifdef DEBUG_BUILD
constexpr bool k_is_debug_build = true;
#else
constexpr bool k_is_debug_build = false;
#endif

#ifdef RELEASE_BUILD
constexpr bool k_is_release_build = true;
#else
constexpr bool k_is_release_build = false;
#endif

#ifdef ADDRESS_SANITIZE
constexpr bool k_is_asan_build = true;
#else
constexpr bool k_is_asan_build = false;
#endif

#ifdef WITH_OPENCV
constexpr bool k_has_opencv = true;
#else
constexpr bool k_has_opencv = false;
#endif

constexpr const char* k_version = SPINDLE_VERSION;

// Must be called before any of the functions below
void load_environment_variables() noexcept;

bool spindle_trace_mode() noexcept;

std::string environment_info() noexcept;

} // namespace spindle
