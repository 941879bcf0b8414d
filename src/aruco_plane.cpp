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

#include "aruco_plane.h"

#include "image_io.h"

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>
#include <fmt/format.h>

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

ArucoPlane::ArucoPlane()
    : dictionary_(cv::aruco::getPredefinedDictionary(cv::aruco::DICT_4X4_50)),
      detector_(dictionary_, cv::aruco::DetectorParameters()) {}

cv::Mat ArucoPlane::generate_marker(int id, int side_pixels) const {
  cv::Mat marker;
  cv::aruco::generateImageMarker(dictionary_, id, side_pixels, marker);
  return marker;
}

std::vector<std::string>
ArucoPlane::generate_markers(const std::string& out_dir, int count,
                             int side_pixels) const {
  fs::create_directories(out_dir);
  std::vector<std::string> paths;
  for (int i = 0; i < count; ++i) {
    auto path =
        (fs::path(out_dir) / fmt::format("aruco_marker_{}.jpg", i)).string();
    im_write(path, generate_marker(i, side_pixels));
    paths.push_back(path);
  }
  return paths;
}

ArucoPlane::Detection ArucoPlane::detect(const cv::Mat& bgr) const {
  cv::Mat gray;
  if (bgr.channels() == 1) {
    gray = bgr;
  } else {
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  }

  std::vector<std::vector<cv::Point2f>> corners, rejected;
  std::vector<int> ids;
  detector_.detectMarkers(gray, corners, ids, rejected);

  Detection det;
  det.ids = ids;
  for (const auto& c : corners) {
    det.top_left.push_back(c[0]);
  }
  return det;
}

HomographyResult ArucoPlane::find_homography(
    const cv::Mat& bgr, const std::vector<cv::Point2f>& world_positions) const {
  auto det = detect(bgr);

  std::vector<cv::Point2f> image_points, world_points;
  for (size_t i = 0; i < det.ids.size(); ++i) {
    int id = det.ids[i];
    if (id < 0 || id >= static_cast<int>(world_positions.size())) {
      continue;
    }
    image_points.push_back(det.top_left[i]);
    world_points.push_back(world_positions[id]);
  }

  if (image_points.size() < 4) {
    throw std::runtime_error(fmt::format(
        "Less than 4 ArUco markers detected ({} usable).", image_points.size()));
  }
  return solve_plane_homography(image_points, world_points);
}

HomographyResult ArucoPlane::find_homography(
    const std::string& image_path,
    const std::vector<cv::Point2f>& world_positions) const {
  return find_homography(im_read(image_path), world_positions);
}

HomographyResult ArucoPlane::find_homography(
    const cv::Mat& bgr, const std::vector<cv::Point2f>& world_positions,
    const cv::Mat& K, const cv::Mat& D) const {
  cv::Mat undist;
  cv::undistort(bgr, undist, K, D);
  return find_homography(undist, world_positions);
}

HomographyResult ArucoPlane::find_homography(
    const std::string& image_path,
    const std::vector<cv::Point2f>& world_positions, const cv::Mat& K,
    const cv::Mat& D) const {
  return find_homography(im_read(image_path), world_positions, K, D);
}
