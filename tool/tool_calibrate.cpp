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

// usage:
//   tool_calibrate ~/Pictures/checkerboard/calibration jpg \
//       ~/Pictures/checkerboard/ref_plan.jpg -s 25 -W 10 -H 7 -o calibration.yml

#include "e_planecalib.h"

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <fstream>
#include <iostream>
#include <string>

using namespace std;
namespace po = boost::program_options;

int main(int argc, char** argv) {
  CalibrationRequest request;
  string config_path;
  int pattern_width, pattern_height;

  po::options_description desc("Allowed options");
  desc.add_options()("help,h", "produce help message")(
      "config,c", po::value<string>(&config_path),
      "Config file with the same option names (key = value)")(
      "dirpath", po::value<string>(&request.dirpath)->required(),
      "Path to the directory containing the calibration images")(
      "image_format", po::value<string>(&request.image_format)->required(),
      "Image format (e.g. \"png\" or \"jpg\")")(
      "ref_plan_path", po::value<string>(&request.ref_plan_path)->required(),
      "Reference plan image; its first inner corner gives the origin of the "
      "working plan")(
      "square_size,s", po::value<float>(&request.square_size)->default_value(25.f),
      "Size of an edge of a checkerboard square in millimeters")(
      "width,W", po::value<int>(&pattern_width)->default_value(10),
      "Number of inner corners along the width")(
      "height,H", po::value<int>(&pattern_height)->default_value(7),
      "Number of inner corners along the height")(
      "origin_x", po::value<float>(&request.origin.x)->default_value(25.f),
      "World x of the first inner corner")(
      "origin_y", po::value<float>(&request.origin.y)->default_value(25.f),
      "World y of the first inner corner")(
      "save_to,o",
      po::value<string>(&request.save_to)->default_value("./calibration.yml"),
      "Path to where to save the calibration (.yml/.xml/.json)")(
      "debug_dir", po::value<string>(&request.debug_dir),
      "Write every accepted view with its detected corners here");

  po::positional_options_description pos;
  pos.add("dirpath", 1).add("image_format", 1).add("ref_plan_path", 1);

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
    if (vm.count("config")) {
      ifstream ifs(vm["config"].as<string>());
      if (!ifs) {
        fmt::print(stderr, "Cannot open config file: {}\n",
                   vm["config"].as<string>());
        return 1;
      }
      po::store(po::parse_config_file(ifs, desc), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    fmt::print(stderr, "Error: {}\n", e.what());
    cerr << desc << endl;
    return 1;
  }
  request.pattern_size = cv::Size(pattern_width, pattern_height);

  CalibrationReport report;
  try {
    report = run_calibration(request);
  } catch (const std::exception& e) {
    fmt::print(stderr, "Calibration failed: {}\n", e.what());
    return -1;
  }

  fmt::print("RMS re-projection error: {}\n", report.rms);
  cout << "Camera matrix (intrinsic parameters):" << "\n"
       << report.coeffs.K << endl;
  cout << "Distortion coefficients:" << "\n" << report.coeffs.D << endl;
  cout << "Homography (reference plan):" << "\n" << report.coeffs.H << endl;
  cout << "Rotation vectors for each image used in calibration:" << endl;
  for (size_t i = 0; i < report.rvecs.size(); ++i) {
    cout << report.used_files[i] << ": " << cv::Mat(report.rvecs[i].t()) << endl;
  }
  cout << "Translation vectors for each image used in calibration:" << endl;
  for (size_t i = 0; i < report.tvecs.size(); ++i) {
    cout << report.used_files[i] << ": " << cv::Mat(report.tvecs[i].t()) << endl;
  }
  if (!report.rejected_files.empty()) {
    fmt::print(stderr, "{} image(s) rejected (no chessboard found).\n",
               report.rejected_files.size());
  }
  return 0;
}
