
#pragma once

// Keep this small
#include "spindle/foundation.hpp"

#include "spindle/utils/math.hpp"
#include "spindle/utils/string-utils.hpp"
#include "spindle/utils/threads.hpp"
#include "spindle/utils/tick-tock.hpp"

#include "spindle/geometry/vector-3.hpp"
#include <string_view>
