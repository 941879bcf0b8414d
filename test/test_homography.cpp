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
#include "synthetic_board.h"

#include <cmath>
#include <iostream>
#include <stdexcept>

int test_reference_plane() {
  SyntheticCamera cam;
  SyntheticBoard board;
  auto R = rotation_xy(0, 0);
  auto t = centered_translation(board, R, 600);
  auto ref = render_view(cam, board, R, t);

  auto finder = PlaneHomographyFinder(cv::Mat(cam.K), cv::Mat::zeros(1, 5, CV_64F));
  auto res = finder.from_chessboard(ref, board.pattern_size, board.square_size);

  if (res.H.rows != 3 || res.H.cols != 3 || res.H.type() != CV_64F) {
    std::cerr << "homography must be 3x3 CV_64F" << std::endl;
    return 1;
  }
  if (static_cast<int>(res.status.total()) != board.pattern_size.area() ||
      cv::countNonZero(res.status) != board.pattern_size.area()) {
    std::cerr << "every corner should be an inlier" << std::endl;
    return 1;
  }

  // world (x, y) of the board -> pixel, then back through H
  auto G = plane_to_image(cam.K, R, t);
  cv::Matx33d H(res.H);
  const cv::Point2d checks[][2] = {
      {{0, 0}, {25, 25}},
      {{225, 150}, {250, 175}},
      {{100, 50}, {125, 75}},
  };
  for (const auto& c : checks) {
    auto xy = project(H, project(G, c[0]));
    if (cv::norm(xy - c[1]) > 0.5) {
      std::cerr << "board point " << c[0] << " mapped to " << xy
                << ", expected " << c[1] << std::endl;
      return 1;
    }
  }

  auto shifted = finder.from_chessboard(ref, board.pattern_size,
                                        board.square_size, {0.f, 0.f});
  auto origin = project(cv::Matx33d(shifted.H), project(G, {0, 0}));
  if (cv::norm(origin) > 0.5) {
    std::cerr << "custom origin should move the first corner to (0, 0)"
              << std::endl;
    return 1;
  }
  return 0;
}

// Reference view taken through a lens with barrel distortion: H has to map
// the undistorted pixels, not the recorded ones, to the plane.
int test_distorted_reference() {
  SyntheticCamera cam;
  SyntheticBoard board;
  auto R = rotation_xy(0, 0);
  auto t = centered_translation(board, R, 450);
  cv::Mat D = (cv::Mat_<double>(1, 5) << -0.25, 0.05, 0, 0, 0);
  auto ref = distort_view(render_view(cam, board, R, t), cam.K, D);

  auto finder = PlaneHomographyFinder(cv::Mat(cam.K), D);
  auto res = finder.from_chessboard(ref, board.pattern_size, board.square_size);

  auto G = plane_to_image(cam.K, R, t);
  cv::Matx33d H(res.H);
  const cv::Point2d corners[] = {
      {0, 0}, {225, 0}, {0, 150}, {225, 150}, {100, 75}};
  for (const auto& c : corners) {
    auto xy = project(H, project(G, c));
    auto expected = c + cv::Point2d(25, 25);
    if (cv::norm(xy - expected) > 0.5) {
      std::cerr << "distorted reference: board point " << c << " mapped to "
                << xy << ", expected " << expected << std::endl;
      return 1;
    }
  }
  return 0;
}

int test_missing_board_throws() {
  SyntheticCamera cam;
  cv::Mat blank(cam.image_size, CV_8UC3, cv::Scalar(255, 255, 255));
  auto finder = PlaneHomographyFinder(cv::Mat(cam.K), cv::Mat::zeros(1, 5, CV_64F));
  try {
    finder.from_chessboard(blank, cv::Size(10, 7), 25.f);
  } catch (const std::runtime_error&) {
    return 0;
  }
  std::cerr << "reference image without a board must throw" << std::endl;
  return 1;
}

int test_too_few_points_throws() {
  try {
    solve_plane_homography({{0, 0}, {1, 0}, {0, 1}}, {{0, 0}, {1, 0}, {0, 1}});
  } catch (const std::runtime_error&) {
    return 0;
  }
  std::cerr << "three correspondences must not be enough" << std::endl;
  return 1;
}

int main() {
  if (test_too_few_points_throws() || test_missing_board_throws() ||
      test_reference_plane() || test_distorted_reference()) {
    return 1;
  }
  std::cout << "test_homography passed" << std::endl;
  return 0;
}
