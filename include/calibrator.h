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

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>

#include <string>
#include <vector>

// Finds the inner corners of a chessboard in a grayscale image and refines
// them to sub-pixel accuracy. The first corner is always the one closest to
// the image origin.
bool find_chessboard_corners(const cv::Mat& gray, const cv::Size& pattern_size,
                             std::vector<cv::Point2f>& corners);

// (i * square_size, j * square_size, 0), i along width, row-major by height.
std::vector<cv::Point3f> chessboard_object_points(const cv::Size& pattern_size,
                                                  float square_size);

class ChessboardCalibrator {
public:
  ChessboardCalibrator(const cv::Size& pattern_size, float square_size)
      : pattern_size_(pattern_size), square_size_(square_size) {}

  ~ChessboardCalibrator() = default;

  struct CalibResult {
    bool success = false;
    /// RMS re-projection error in pixels
    double rms = 0.0;
    cv::Mat K;
    cv::Mat dist;
    std::vector<cv::Mat> rvecs;
    std::vector<cv::Mat> tvecs;
    cv::Size image_size;
    std::vector<std::string> used_files;
    std::vector<std::string> rejected_files;
  };

  // Returns false (and records the view as rejected) when the board is not
  // found or the image size differs from the previously accepted views.
  bool add_image(const cv::Mat& bgr, const std::string& name = "");
  bool add_image_file(const std::string& file_path);

  // Throws std::runtime_error when no view was accepted.
  CalibResult calibrate() const;

  // Enumerates <dir>/*.<image_format>, adds every file and calibrates.
  CalibResult calibrate(const std::string& dir,
                        const std::string& image_format);

  void set_debug_dir(const std::string& dir) { debug_dir_ = dir; }
  size_t num_views() const { return image_points_.size(); }

private:
  void save_debug_view(const cv::Mat& bgr, const std::vector<cv::Point2f>& corners,
                       const std::string& name) const;

private:
  cv::Size pattern_size_;
  float square_size_;
  cv::Size image_size_;
  std::string debug_dir_;
  std::vector<std::vector<cv::Point3f>> object_points_;
  std::vector<std::vector<cv::Point2f>> image_points_;
  std::vector<std::string> used_files_;
  std::vector<std::string> rejected_files_;
};
