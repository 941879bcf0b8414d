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

#include "image_io.h"
#include "image_transform.h"

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char** argv) {
  string input_dir, output_dir, calibration_path, image_path;
  int width, height;
  vector<double> points;

  po::options_description desc("Allowed options");
  desc.add_options()("help,h", "produce help message")(
      "calibration,k", po::value<string>(&calibration_path)->required(),
      "Calibration file written by tool_calibrate")(
      "input,i", po::value<string>(&input_dir),
      "Directory of images to preprocess")(
      "image", po::value<string>(&image_path), "Single image to preprocess")(
      "output,o", po::value<string>(&output_dir)->default_value("./preprocessed"),
      "Output directory")(
      "width", po::value<int>(&width)->default_value(640),
      "Output image width")(
      "height", po::value<int>(&height)->default_value(480),
      "Output image height")(
      "point,p", po::value<vector<double>>(&points)->multitoken(),
      "Undistorted image point(s) x y [x y ...] to map to world coordinates");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
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

  if (input_dir.empty() && image_path.empty() && points.empty()) {
    fmt::print(stderr, "Nothing to do: give --input, --image or --point.\n");
    return 1;
  }
  if (points.size() % 2 != 0) {
    fmt::print(stderr, "--point expects pairs of coordinates.\n");
    return 1;
  }

  try {
    auto transformer = ImageTransformer(
        calibration_path, ImageTransformer::WarpInfo(width, height));

    if (!input_dir.empty()) {
      auto written = transformer.BatchPreprocess(input_dir, output_dir);
      fmt::print("{} image(s) preprocessed.\n", written.size());
    }
    if (!image_path.empty()) {
      fs::create_directories(output_dir);
      auto output_path =
          (fs::path(output_dir) / fs::path(image_path).filename()).string();
      im_write(output_path, transformer.Preprocess(image_path));
      fmt::print("Processed image saved to {}\n", output_path);
    }
    for (size_t i = 0; i + 1 < points.size(); i += 2) {
      auto xy = transformer.ImageToWorld(cv::Point2d(points[i], points[i + 1]));
      fmt::print("({}, {}) -> ({}, {})\n", points[i], points[i + 1], xy.x,
                 xy.y);
    }
  } catch (const std::exception& e) {
    fmt::print(stderr, "Preprocessing failed: {}\n", e.what());
    return -1;
  }
  return 0;
}
