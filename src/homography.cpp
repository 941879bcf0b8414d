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

#include "homography.h"

#include "calibrator.h"
#include "image_io.h"

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>

#include <stdexcept>

HomographyResult
solve_plane_homography(const std::vector<cv::Point2f>& image_points,
                       const std::vector<cv::Point2f>& world_points) {
  if (image_points.size() < 4 || image_points.size() != world_points.size()) {
    throw std::runtime_error(
        "Homography needs at least 4 image/world correspondences");
  }

  HomographyResult res;
  res.H = cv::findHomography(image_points, world_points, 0, 3, res.status);
  if (res.H.empty()) {
    throw std::runtime_error("Homography estimation failed");
  }
  res.H.convertTo(res.H, CV_64F);
  res.image_points = image_points;
  res.world_points = world_points;
  return res;
}

HomographyResult PlaneHomographyFinder::from_chessboard(
    const cv::Mat& ref_bgr, const cv::Size& pattern_size, float square_size,
    const cv::Point2f& origin) const {
  cv::Mat undist;
  cv::undistort(ref_bgr, undist, K_, dist_);

  cv::Mat gray;
  if (undist.channels() == 1) {
    gray = undist;
  } else {
    cv::cvtColor(undist, gray, cv::COLOR_BGR2GRAY);
  }

  std::vector<cv::Point2f> corners;
  if (!find_chessboard_corners(gray, pattern_size, corners)) {
    throw std::runtime_error("Checkerboard not found in the provided image.");
  }

  std::vector<cv::Point2f> world;
  world.reserve(corners.size());
  for (const auto& p : chessboard_object_points(pattern_size, square_size)) {
    world.emplace_back(p.x + origin.x, p.y + origin.y);
  }
  return solve_plane_homography(corners, world);
}

HomographyResult PlaneHomographyFinder::from_chessboard(
    const std::string& ref_path, const cv::Size& pattern_size,
    float square_size, const cv::Point2f& origin) const {
  return from_chessboard(im_read(ref_path), pattern_size, square_size, origin);
}
