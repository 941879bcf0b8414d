/*
 * Copyright (c) 2022-2025, William Wei. All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

struct HomographyResult {
  /// image pixels (undistorted) -> world plane, 3x3 CV_64F
  cv::Mat H;
  /// 1 = inlier, 0 = outlier, one entry per correspondence
  cv::Mat status;
  std::vector<cv::Point2f> image_points;
  std::vector<cv::Point2f> world_points;
};

class PlaneHomographyFinder {
public:
  PlaneHomographyFinder(const cv::Mat& K, const cv::Mat& dist)
      : K_(K), dist_(dist) {}

  /// Undistorts the reference view, detects the chessboard and solves the
  /// homography to the grid (i * square, j * square) + origin. The default
  /// origin puts the first inner corner at (25, 25) in world units.
  /// Throws std::runtime_error if the chessboard is not visible.
  HomographyResult from_chessboard(const cv::Mat& ref_bgr,
                                   const cv::Size& pattern_size,
                                   float square_size,
                                   const cv::Point2f& origin = {25.f, 25.f}) const;
  HomographyResult from_chessboard(const std::string& ref_path,
                                   const cv::Size& pattern_size,
                                   float square_size,
                                   const cv::Point2f& origin = {25.f, 25.f}) const;

private:
  cv::Mat K_;
  cv::Mat dist_;
};

// Plain DLT/RANSAC fit shared by the chessboard and marker paths.
HomographyResult
solve_plane_homography(const std::vector<cv::Point2f>& image_points,
                       const std::vector<cv::Point2f>& world_points);
