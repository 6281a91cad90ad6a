
#pragma once

#include "spindle/pairing/pairing-params.hpp"

#include <opencv2/core.hpp>

namespace spindle
{
// The box of valid (non-padding) pixels in a registered, zero-padded stack.
// Each non-empty frame is scanned along its middle column (top and bottom)
// and middle row (left and right) to the first non-zero pixel. The result is
// the tightest box over all frames, in pixels. Empty (all zero) frames are
// skipped, and no frames at all gives an unset ValidBounds.
//
// Throws std::runtime_error if the frames differ in size.
ValidBounds
find_valid_pixel_bounds(const vector<cv::Mat>& frames) noexcept(false);

// Reads a multi-page TIFF ordered (frame, z-step, channel), and keeps the
// first z-step and channel of every frame.
// Throws std::runtime_error if the file cannot be read.
vector<cv::Mat> load_movie_frames(const string_view fname,
                                  const int n_zsteps,
                                  const int n_channels = 1) noexcept(false);

} // namespace spindle
