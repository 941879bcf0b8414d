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

#include "coeff_store.h"

#include "json.h"

#include <opencv2/core/persistence.hpp>

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

static bool is_json(const std::string& path) {
  auto ext = fs::path(path).extension().string();
  return ext == ".json" || ext == ".JSON";
}

static bool valid_dist_size(size_t n) {
  return n == 4 || n == 5 || n == 8 || n == 12 || n == 14;
}

static cv::Mat normalize(const cv::Mat& m) {
  if (m.empty()) {
    return m;
  }
  cv::Mat out;
  m.convertTo(out, CV_64F);
  return out;
}

void validate_coefficients(const CalibrationCoefficients& coeffs) {
  if (coeffs.K.rows != 3 || coeffs.K.cols != 3) {
    throw std::runtime_error("Camera matrix K must be 3x3");
  }
  if (coeffs.D.empty() || (coeffs.D.rows != 1 && coeffs.D.cols != 1) ||
      !valid_dist_size(coeffs.D.total())) {
    throw std::runtime_error(
        "Distortion D must be a vector of 4, 5, 8, 12 or 14 coefficients");
  }
  if (coeffs.H.rows != 3 || coeffs.H.cols != 3) {
    throw std::runtime_error("Homography H must be 3x3");
  }
}

static void save_file_storage(const CalibrationCoefficients& coeffs,
                              const std::string& path) {
  cv::FileStorage fs(path, cv::FileStorage::WRITE);
  if (!fs.isOpened()) {
    throw std::runtime_error("Cannot open calibration file for writing: " +
                             path);
  }
  fs << "K" << coeffs.K;
  fs << "D" << coeffs.D;
  fs << "H" << coeffs.H;
  fs.release();
}

static CalibrationCoefficients load_file_storage(const std::string& path) {
  cv::FileStorage fs(path, cv::FileStorage::READ);
  if (!fs.isOpened()) {
    throw std::runtime_error("Cannot open calibration file: " + path);
  }

  CalibrationCoefficients coeffs;
  for (const auto& key : {"K", "D", "H"}) {
    if (fs[key].empty()) {
      throw std::runtime_error("Calibration file " + path + " has no node " +
                               key);
    }
  }
  fs["K"] >> coeffs.K;
  fs["D"] >> coeffs.D;
  fs["H"] >> coeffs.H;
  fs.release();
  return coeffs;
}

static void save_json(const CalibrationCoefficients& coeffs,
                      const std::string& path) {
  json j;
  j["cam_intrinsic"] = mat_to_json(coeffs.K);
  j["cam_distcoeffs"] = mat_to_json(coeffs.D);
  j["homography"] = mat_to_json(coeffs.H);
  write_json(j, path);
}

static CalibrationCoefficients load_json(const std::string& path) {
  auto j = read_json(path);
  for (const auto& key : {"cam_intrinsic", "cam_distcoeffs", "homography"}) {
    if (!j.contains(key)) {
      throw std::runtime_error("Calibration file " + path + " has no key " +
                               key);
    }
  }

  CalibrationCoefficients coeffs;
  coeffs.K = json_to_mat(j["cam_intrinsic"], 3, 3);
  const auto& dist = j["cam_distcoeffs"];
  if (dist.is_array()) {
    coeffs.D = json_to_mat(dist, 1, static_cast<int>(dist.size()));
  }
  coeffs.H = json_to_mat(j["homography"], 3, 3);
  return coeffs;
}

void save_coefficients(const CalibrationCoefficients& coeffs,
                       const std::string& path) {
  validate_coefficients(coeffs);
  CalibrationCoefficients c{normalize(coeffs.K),
                            normalize(coeffs.D).reshape(1, 1),
                            normalize(coeffs.H)};
  if (is_json(path)) {
    save_json(c, path);
  } else {
    save_file_storage(c, path);
  }
}

CalibrationCoefficients load_coefficients(const std::string& path) {
  auto raw = is_json(path) ? load_json(path) : load_file_storage(path);

  CalibrationCoefficients coeffs{normalize(raw.K), normalize(raw.D),
                                 normalize(raw.H)};
  if (!coeffs.D.empty()) {
    coeffs.D = coeffs.D.reshape(1, 1);
  }
  validate_coefficients(coeffs);
  return coeffs;
}
