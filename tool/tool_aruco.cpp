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
#include "coeff_store.h"

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <iostream>
#include <string>
#include <vector>

using namespace std;
namespace po = boost::program_options;

int main(int argc, char** argv) {
  string mode, output_dir, image_path, calibration_path;
  int count, size;
  vector<float> world;

  po::options_description desc("Allowed options");
  desc.add_options()("help,h", "produce help message")(
      "mode", po::value<string>(&mode)->required(),
      "\"generate\" printable markers or solve the \"homography\"")(
      "count,n", po::value<int>(&count)->default_value(4),
      "Number of markers to generate")(
      "size", po::value<int>(&size)->default_value(100),
      "Marker side in pixels")(
      "output,o", po::value<string>(&output_dir)->default_value("."),
      "Output directory for generated markers")(
      "image,i", po::value<string>(&image_path),
      "Image showing markers 0..3")(
      "world,w", po::value<vector<float>>(&world)->multitoken(),
      "World positions x0 y0 x1 y1 ... of the marker top-left corners")(
      "calibration,k", po::value<string>(&calibration_path),
      "Calibration file whose homography is replaced");

  po::positional_options_description pos;
  pos.add("mode", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(pos)
                  .run(),
              vm);
    if (vm.count("help")) {
      cout << desc << endl;
      return 1;
    }
    po::notify(vm);
  } catch (const po::error& e) {
    fmt::print(stderr, "Error: {}\n", e.what());
    cerr << desc << endl;
    return 1;
  }

  ArucoPlane aruco;
  try {
    if (mode == "generate") {
      for (const auto& path : aruco.generate_markers(output_dir, count, size)) {
        fmt::print("Marker saved to {}\n", path);
      }
      return 0;
    }
    if (mode != "homography") {
      fmt::print(stderr, "Unknown mode: {}\n", mode);
      return 1;
    }
    if (image_path.empty() || world.size() < 8 || world.size() % 2 != 0) {
      fmt::print(stderr,
                 "homography needs --image and at least 4 world points.\n");
      return 1;
    }

    vector<cv::Point2f> positions;
    for (size_t i = 0; i + 1 < world.size(); i += 2) {
      positions.emplace_back(world[i], world[i + 1]);
    }
    if (calibration_path.empty()) {
      auto res = aruco.find_homography(image_path, positions);
      cout << "Homography:" << "\n" << res.H << endl;
      return 0;
    }

    // stored H is applied after undistortion, so solve it on the
    // undistorted view
    auto coeffs = load_coefficients(calibration_path);
    auto res =
        aruco.find_homography(image_path, positions, coeffs.K, coeffs.D);
    cout << "Homography:" << "\n" << res.H << endl;
    coeffs.H = res.H;
    save_coefficients(coeffs, calibration_path);
    fmt::print("Homography updated in {}\n", calibration_path);
  } catch (const std::exception& e) {
    fmt::print(stderr, "ArUco step failed: {}\n", e.what());
    return -1;
  }
  return 0;
}
