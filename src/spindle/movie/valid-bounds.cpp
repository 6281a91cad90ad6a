
#include "valid-bounds.hpp"

#include <opencv2/imgcodecs.hpp>

namespace spindle
{
static bool is_nonzero(const cv::Mat& im, int y, int x) noexcept
{
   return cv::countNonZero(im(cv::Rect(x, y, 1, 1)).reshape(1)) > 0;
}

static bool is_empty_frame(const cv::Mat& im) noexcept
{
   return im.empty() or cv::countNonZero(im.reshape(1)) == 0;
}

// ----------------------------------------------------- find-valid-pixel-bounds
//
ValidBounds
find_valid_pixel_bounds(const vector<cv::Mat>& frames) noexcept(false)
{
   if(frames.empty()) return ValidBounds{};

   const int rows = frames.front().rows;
   const int cols = frames.front().cols;
   ValidBounds o(0.0, real(rows), 0.0, real(cols));

   const int mid_x = cols / 2;
   const int mid_y = rows / 2;

   int counter = 0;
   for(const auto& im : frames) {
      ++counter;
      if(im.rows != rows or im.cols != cols)
         throw std::runtime_error(
             format("frame #{} is {}x{}, but expected {}x{}",
                    counter - 1,
                    im.cols,
                    im.rows,
                    cols,
                    rows));

      if(is_empty_frame(im)) continue;

      // Each scan stops at the frame edge
      for(int y = 0; y < rows; ++y)
         if(is_nonzero(im, y, mid_x)) {
            o.top = std::max(o.top, real(y));
            break;
         }

      for(int y = rows - 1; y >= 0; --y)
         if(is_nonzero(im, y, mid_x)) {
            o.bottom = std::min(o.bottom, real(y));
            break;
         }

      for(int x = 0; x < cols; ++x)
         if(is_nonzero(im, mid_y, x)) {
            o.left = std::max(o.left, real(x));
            break;
         }

      for(int x = cols - 1; x >= 0; --x)
         if(is_nonzero(im, mid_y, x)) {
            o.right = std::min(o.right, real(x));
            break;
         }
   }

   return o;
}

// ----------------------------------------------------------- load-movie-frames
//
vector<cv::Mat> load_movie_frames(const string_view fname,
                                  const int n_zsteps,
                                  const int n_channels) noexcept(false)
{
   if(n_zsteps < 1 or n_channels < 1)
      throw std::runtime_error(
          format("invalid stack layout: z-steps = {}, channels = {}",
                 n_zsteps,
                 n_channels));

   vector<cv::Mat> pages;
   if(!cv::imreadmulti(string(fname), pages, cv::IMREAD_UNCHANGED)
      or pages.empty())
      throw std::runtime_error(
          format("OpenCV failed to load image stack '{}'", fname));

   const size_t stride = size_t(n_zsteps) * size_t(n_channels);
   if(pages.size() % stride != 0)
      WARN(format("stack '{}' has {} pages, which is not a multiple of "
                  "z-steps x channels = {}",
                  fname,
                  pages.size(),
                  stride));

   vector<cv::Mat> o;
   o.reserve(pages.size() / stride + 1);
   for(size_t i = 0; i < pages.size(); i += stride) o.push_back(pages[i]);
   return o;
}

} // namespace spindle
