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

#include <fstream>
#include <string>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

using json = nlohmann::json;

inline json read_json(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw std::runtime_error("Cannot open JSON file: " + path);
  }
  try {
    return json::parse(f);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Malformed JSON file " + path + ": " + e.what());
  }
}

inline void write_json(const json& j, const std::string& path) {
  std::ofstream f(path);
  if (!f.is_open()) {
    throw std::runtime_error("Cannot write JSON file: " + path);
  }
  f << j.dump(2) << std::endl;
}

// Row-major flatten, the layout used by "cam_intrinsic" / "cam_distcoeffs".
inline json mat_to_json(const cv::Mat& m) {
  cv::Mat m64;
  m.convertTo(m64, CV_64F);
  m64 = m64.reshape(1, 1);
  json arr = json::array();
  for (int i = 0; i < m64.cols; ++i) {
    arr.push_back(m64.at<double>(0, i));
  }
  return arr;
}

inline cv::Mat json_to_mat(const json& arr, int rows, int cols) {
  if (!arr.is_array() || arr.size() != static_cast<size_t>(rows * cols)) {
    return cv::Mat();
  }
  cv::Mat m(rows, cols, CV_64F);
  for (int i = 0; i < rows * cols; ++i) {
    if (!arr[i].is_number()) {
      return cv::Mat();
    }
    m.at<double>(i / cols, i % cols) = arr[i].get<double>();
  }
  return m;
}
