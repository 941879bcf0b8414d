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

// Reference plane from four printed ArUco markers (DICT_4X4_50) instead of a
// chessboard. Marker k is the one whose top-left corner sits at world
// position k.

#pragma once

#include "homography.h"

#include <opencv2/objdetect/aruco_detector.hpp>

#include <string>
#include <vector>

class ArucoPlane {
public:
  ArucoPlane();

  struct Detection {
    std::vector<int> ids;
    /// top-left corner of each marker, same order as ids
    std::vector<cv::Point2f> top_left;
  };

  cv::Mat generate_marker(int id, int side_pixels) const;
  /// Writes aruco_marker_<i>.jpg for i in [0, count), returns the paths.
  std::vector<std::string> generate_markers(const std::string& out_dir,
                                            int count = 4,
                                            int side_pixels = 100) const;

  Detection detect(const cv::Mat& bgr) const;

  // Throws std::runtime_error if fewer than 4 of the requested markers are
  // visible.
  HomographyResult
  find_homography(const cv::Mat& bgr,
                  const std::vector<cv::Point2f>& world_positions) const;
  HomographyResult
  find_homography(const std::string& image_path,
                  const std::vector<cv::Point2f>& world_positions) const;

  // Removes lens distortion with K, D before detecting, so H maps the
  // undistorted image to the plane like the H of a calibration file.
  HomographyResult
  find_homography(const cv::Mat& bgr,
                  const std::vector<cv::Point2f>& world_positions,
                  const cv::Mat& K, const cv::Mat& D) const;
  HomographyResult
  find_homography(const std::string& image_path,
                  const std::vector<cv::Point2f>& world_positions,
                  const cv::Mat& K, const cv::Mat& D) const;

private:
  cv::aruco::Dictionary dictionary_;
  cv::aruco::ArucoDetector detector_;
};
