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

#include "calibrator.h"

#include "image_io.h"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

bool find_chessboard_corners(const cv::Mat& gray, const cv::Size& pattern_size,
                             std::vector<cv::Point2f>& corners) {
  bool found = cv::findChessboardCorners(
      gray, pattern_size, corners,
      cv::CALIB_CB_ADAPTIVE_THRESH | cv::CALIB_CB_NORMALIZE_IMAGE);
  if (!found || corners.empty()) {
    return false;
  }

  cv::Point2f p0 = corners.front();
  cv::Point2f pn = corners.back();
  float dist0 = p0.x * p0.x + p0.y * p0.y;
  float distn = pn.x * pn.x + pn.y * pn.y;
  if (dist0 > distn) {
    std::reverse(corners.begin(), corners.end());
  }

  cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER,
                            30, 0.001);
  cv::cornerSubPix(gray, corners, cv::Size(11, 11), cv::Size(-1, -1), criteria);
  return true;
}

std::vector<cv::Point3f> chessboard_object_points(const cv::Size& pattern_size,
                                                  float square_size) {
  std::vector<cv::Point3f> objp;
  objp.reserve(pattern_size.area());
  for (int i = 0; i < pattern_size.height; ++i) {
    for (int j = 0; j < pattern_size.width; ++j) {
      objp.push_back(cv::Point3f(j * square_size, i * square_size, 0));
    }
  }
  return objp;
}

bool ChessboardCalibrator::add_image(const cv::Mat& bgr,
                                     const std::string& name) {
  if (bgr.empty()) {
    rejected_files_.push_back(name);
    return false;
  }
  if (!image_points_.empty() && bgr.size() != image_size_) {
    fmt::print(stderr, "Skipping {}: size {}x{} differs from {}x{}.\n", name,
               bgr.cols, bgr.rows, image_size_.width, image_size_.height);
    rejected_files_.push_back(name);
    return false;
  }

  cv::Mat gray;
  if (bgr.channels() == 1) {
    gray = bgr;
  } else {
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  }

  std::vector<cv::Point2f> corners;
  if (!find_chessboard_corners(gray, pattern_size_, corners)) {
    fmt::print(stderr, "Chessboard not found in {}.\n", name);
    rejected_files_.push_back(name);
    return false;
  }

  image_size_ = gray.size();
  object_points_.push_back(chessboard_object_points(pattern_size_, square_size_));
  image_points_.push_back(corners);
  used_files_.push_back(name);

  if (!debug_dir_.empty()) {
    save_debug_view(bgr, corners, name);
  }
  return true;
}

bool ChessboardCalibrator::add_image_file(const std::string& file_path) {
  return add_image(im_read(file_path), file_path);
}

ChessboardCalibrator::CalibResult ChessboardCalibrator::calibrate() const {
  if (image_points_.empty()) {
    throw std::runtime_error(
        fmt::format("No {}x{} chessboard was found in any calibration image",
                    pattern_size_.width, pattern_size_.height));
  }

  CalibResult res;
  res.rms = cv::calibrateCamera(object_points_, image_points_, image_size_,
                                res.K, res.dist, res.rvecs, res.tvecs);
  res.K.convertTo(res.K, CV_64F);
  res.dist.convertTo(res.dist, CV_64F);
  res.dist = res.dist.reshape(1, 1);
  res.image_size = image_size_;
  res.used_files = used_files_;
  res.rejected_files = rejected_files_;
  res.success = true;
  return res;
}

ChessboardCalibrator::CalibResult
ChessboardCalibrator::calibrate(const std::string& dir,
                                const std::string& image_format) {
  auto files = list_images(dir, image_format);
  if (files.empty()) {
    throw std::runtime_error(
        fmt::format("No *.{} images in {}", image_format, dir));
  }
  for (const auto& file : files) {
    add_image_file(file);
  }
  fmt::print("Chessboard found in {}/{} images.\n", image_points_.size(),
             files.size());
  return calibrate();
}

void ChessboardCalibrator::save_debug_view(
    const cv::Mat& bgr, const std::vector<cv::Point2f>& corners,
    const std::string& name) const {
  fs::create_directories(debug_dir_);
  cv::Mat sketch = bgr.clone();
  if (sketch.channels() == 1) {
    cv::cvtColor(sketch, sketch, cv::COLOR_GRAY2BGR);
  }
  cv::drawChessboardCorners(sketch, pattern_size_, corners, true);

  std::string stem = name.empty()
                         ? fmt::format("view_{}", image_points_.size())
                         : fs::path(name).stem().string();
  im_write((fs::path(debug_dir_) / (stem + "_corners.png")).string(), sketch);
}
