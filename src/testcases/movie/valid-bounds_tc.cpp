
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "spindle/movie/valid-bounds.hpp"

static const bool feedback = false;

namespace spindle
{
// A 30x20 frame, non-zero inside 'roi'
static cv::Mat make_padded_frame(const cv::Rect& roi, int type = CV_16UC1)
{
   cv::Mat im = cv::Mat::zeros(20, 30, type);
   if(roi.area() > 0) im(roi).setTo(cv::Scalar::all(7));
   return im;
}

CATCH_TEST_CASE("FindValidPixelBounds", "[valid-bounds]")
{
   CATCH_SECTION("valid-bounds-single-frame")
   {
      // Rows [3..15], cols [5..24]
      const auto b
          = find_valid_pixel_bounds({make_padded_frame(cv::Rect(5, 3, 20, 13))});
      if(feedback) INFO(b.to_string());
      CATCH_REQUIRE(b.top == 3.0);
      CATCH_REQUIRE(b.bottom == 15.0);
      CATCH_REQUIRE(b.left == 5.0);
      CATCH_REQUIRE(b.right == 24.0);
   }

   CATCH_SECTION("valid-bounds-tightest-over-frames")
   {
      const vector<cv::Mat> frames{
          make_padded_frame(cv::Rect(5, 3, 20, 13)), // [3..15] x [5..24]
          make_padded_frame(cv::Rect()),             // empty, skipped
          make_padded_frame(cv::Rect(4, 4, 19, 13))  // [4..16] x [4..22]
      };
      const auto b = find_valid_pixel_bounds(frames);
      CATCH_REQUIRE(b.top == 4.0);
      CATCH_REQUIRE(b.bottom == 15.0);
      CATCH_REQUIRE(b.left == 5.0);
      CATCH_REQUIRE(b.right == 22.0);
      CATCH_REQUIRE(b.is_valid());
   }

   CATCH_SECTION("valid-bounds-degenerate")
   {
      CATCH_REQUIRE(!find_valid_pixel_bounds({}).is_set());

      // Only empty frames: the full frame
      const auto full = find_valid_pixel_bounds(
          {make_padded_frame(cv::Rect()), make_padded_frame(cv::Rect())});
      CATCH_REQUIRE(full.top == 0.0);
      CATCH_REQUIRE(full.bottom == 20.0);
      CATCH_REQUIRE(full.left == 0.0);
      CATCH_REQUIRE(full.right == 30.0);

      // Nothing in the middle column: top and bottom are unchanged
      const auto b = find_valid_pixel_bounds(
          {make_padded_frame(cv::Rect(0, 0, 4, 20), CV_8UC3)});
      CATCH_REQUIRE(b.top == 0.0);
      CATCH_REQUIRE(b.bottom == 20.0);
      CATCH_REQUIRE(b.left == 0.0);
      CATCH_REQUIRE(b.right == 3.0);

      const vector<cv::Mat> mixed{make_padded_frame(cv::Rect(1, 1, 2, 2)),
                                  cv::Mat::zeros(10, 10, CV_16UC1)};
      CATCH_REQUIRE_THROWS_AS(find_valid_pixel_bounds(mixed),
                              std::runtime_error);
   }

   CATCH_SECTION("load-movie-frames-errors")
   {
      CATCH_REQUIRE_THROWS_AS(
          load_movie_frames("/this/file/does/not/exist.tif", 1),
          std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(
          load_movie_frames("/this/file/does/not/exist.tif", 0),
          std::runtime_error);
   }
}

} // namespace spindle
