
#pragma once

#include "config.hpp"

// ---------------------------------------------------------------------- Likely

#if defined(__clang__) || defined(__GNUC__)
#define branch_is_likely(x) __builtin_expect(!!(x), 1)
#else
#define branch_is_likely(x) (!!(x))
#endif

// -------------------------------------------------------------- C/C++ Includes

#ifndef __cplusplus
#error "this is a c++ only include"
#endif

// C includes
#include <assert.h>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
// C++ includes
#include <algorithm>
#include <array>
#include <cstddef>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unordered_map>

// ------------------------------------------------------------------ Beyond std

#include "fmt/format.h"

// ------------------------------------------------------------ Spindle headers

#include "utils/logger.hpp"
#include "utils/threads.hpp"

namespace spindle
{
using fmt::format;

using std::array;
using std::string;
using std::string_view;
using std::vector;

using std::cout;
using std::endl;

using std::cbegin;
using std::cend;

using namespace std::string_literals;

using real = double;

// -- Adjust GSL Expects macro
#ifdef Expects
#undef Expects
#endif
#define Expects(cond)                  \
   {                                   \
      if(!branch_is_likely(cond)) {    \
         assert(false);                \
         FATAL("Precondition failed"); \
      }                                \
   }

using std::unique_ptr;

template<class Key, class T> using hashmap = std::unordered_map<Key, T>;

} // namespace spindle
