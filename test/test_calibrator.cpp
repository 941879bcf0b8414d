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
#include "synthetic_board.h"

#include <opencv2/imgcodecs.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Pose {
  double deg_x, deg_y, dx, dy;
};

const std::vector<Pose> poses = {
    {0, 0, 0, 0},     {18, 0, 20, 0},   {-18, 0, -20, 10}, {0, 18, 0, -15},
    {0, -18, 10, 10}, {12, 12, -15, 0}, {-12, 15, 0, 15},  {15, -12, 15, -10},
};

int test_calibrate_directory() {
  SyntheticCamera cam;
  SyntheticBoard board;
  auto dir = make_temp_dir("planecalib_test_calibrator");

  for (size_t i = 0; i < poses.size(); ++i) {
    auto R = rotation_xy(poses[i].deg_x, poses[i].deg_y);
    auto t = centered_translation(board, R, 600, poses[i].dx, poses[i].dy);
    cv::imwrite((dir / ("view_" + std::to_string(i) + ".png")).string(),
                render_view(cam, board, R, t));
  }
  // no board in this one
  cv::imwrite((dir / "blank.png").string(),
              cv::Mat(cam.image_size, CV_8UC3, cv::Scalar(255, 255, 255)));
  // wrong extension, must be ignored
  cv::imwrite((dir / "view_0.jpg").string(),
              cv::Mat(cam.image_size, CV_8UC3, cv::Scalar(0, 0, 0)));
  std::ofstream(dir / "notes.txt") << "not an image";

  auto debug_dir = dir / "debug";
  auto calibrator = ChessboardCalibrator(board.pattern_size, board.square_size);
  calibrator.set_debug_dir(debug_dir.string());
  auto res = calibrator.calibrate(dir.string() + "/", "png");

  if (!res.success) {
    std::cerr << "calibration should succeed" << std::endl;
    return 1;
  }
  if (res.used_files.size() != poses.size() || res.rejected_files.size() != 1) {
    std::cerr << "expected " << poses.size() << " used and 1 rejected view, got "
              << res.used_files.size() << " / " << res.rejected_files.size()
              << std::endl;
    return 1;
  }
  if (res.rvecs.size() != poses.size() || res.tvecs.size() != poses.size()) {
    std::cerr << "one rvec/tvec per used view expected" << std::endl;
    return 1;
  }
  if (res.K.rows != 3 || res.K.cols != 3 || res.K.type() != CV_64F) {
    std::cerr << "K must be 3x3 CV_64F" << std::endl;
    return 1;
  }
  if (res.dist.rows != 1 || res.dist.total() < 4) {
    std::cerr << "dist must be a row of at least 4 coefficients" << std::endl;
    return 1;
  }
  if (res.image_size != cam.image_size) {
    std::cerr << "image size mismatch" << std::endl;
    return 1;
  }
  if (res.rms > 0.5) {
    std::cerr << "RMS too large for noise-free views: " << res.rms << std::endl;
    return 1;
  }
  double fx = res.K.at<double>(0, 0);
  double fy = res.K.at<double>(1, 1);
  if (std::abs(fx - 600) > 12 || std::abs(fy - 600) > 12) {
    std::cerr << "focal length off: " << fx << ", " << fy << std::endl;
    return 1;
  }
  if (std::abs(res.K.at<double>(0, 2) - 320) > 10 ||
      std::abs(res.K.at<double>(1, 2) - 240) > 10) {
    std::cerr << "principal point off: " << res.K << std::endl;
    return 1;
  }

  // first view is fronto-parallel at depth 600 around the board center
  double tz = res.tvecs[0].at<double>(2);
  if (std::abs(tz - 600) > 15) {
    std::cerr << "translation should be in board units, tz = " << tz
              << std::endl;
    return 1;
  }

  size_t sketches = 0;
  for (const auto& entry : fs::directory_iterator(debug_dir)) {
    if (entry.path().string().ends_with("_corners.png"))
      ++sketches;
  }
  if (sketches != poses.size()) {
    std::cerr << "one debug sketch per used view expected" << std::endl;
    return 1;
  }

  fs::remove_all(dir);
  return 0;
}

int test_no_board_throws() {
  auto dir = make_temp_dir("planecalib_test_calibrator_empty");
  cv::imwrite((dir / "blank.png").string(),
              cv::Mat(480, 640, CV_8UC3, cv::Scalar(255, 255, 255)));

  auto calibrator = ChessboardCalibrator(cv::Size(10, 7), 25.f);
  bool thrown = false;
  try {
    calibrator.calibrate(dir.string(), "png");
  } catch (const std::runtime_error&) {
    thrown = true;
  }
  fs::remove_all(dir);
  if (!thrown) {
    std::cerr << "calibration without any board must throw" << std::endl;
    return 1;
  }

  bool missing_thrown = false;
  try {
    ChessboardCalibrator(cv::Size(10, 7), 25.f)
        .calibrate((dir / "does_not_exist").string(), "png");
  } catch (const std::runtime_error&) {
    missing_thrown = true;
  }
  if (!missing_thrown) {
    std::cerr << "missing directory must throw" << std::endl;
    return 1;
  }
  return 0;
}

int test_size_mismatch_rejected() {
  SyntheticCamera cam;
  SyntheticBoard board;
  auto view = render_view(cam, board, rotation_xy(0, 0),
                          centered_translation(board, rotation_xy(0, 0), 600));

  auto calibrator = ChessboardCalibrator(board.pattern_size, board.square_size);
  if (!calibrator.add_image(view, "first")) {
    std::cerr << "fronto-parallel view should be accepted" << std::endl;
    return 1;
  }
  cv::Mat bigger;
  cv::copyMakeBorder(view, bigger, 0, 40, 0, 40, cv::BORDER_CONSTANT,
                     cv::Scalar(255, 255, 255));
  if (calibrator.add_image(bigger, "bigger")) {
    std::cerr << "view with a different size must be rejected" << std::endl;
    return 1;
  }
  if (calibrator.num_views() != 1) {
    std::cerr << "rejected view must not be accumulated" << std::endl;
    return 1;
  }
  return 0;
}

int test_object_points_layout() {
  auto objp = chessboard_object_points(cv::Size(3, 2), 10.f);
  if (objp.size() != 6) {
    std::cerr << "object point count" << std::endl;
    return 1;
  }
  if (objp[1] != cv::Point3f(10, 0, 0) || objp[3] != cv::Point3f(0, 10, 0) ||
      objp[5] != cv::Point3f(20, 10, 0)) {
    std::cerr << "object points must run along the width first" << std::endl;
    return 1;
  }
  return 0;
}

int main() {
  if (test_object_points_layout() || test_size_mismatch_rejected() ||
      test_no_board_throws() || test_calibrate_directory()) {
    return 1;
  }
  std::cout << "test_calibrator passed" << std::endl;
  return 0;
}
