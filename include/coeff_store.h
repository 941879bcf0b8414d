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

#include <opencv2/core.hpp>

#include <string>

struct CalibrationCoefficients {
  /// camera matrix, 3x3
  cv::Mat K;
  /// distortion, 1xN with N in {4, 5, 8, 12, 14}
  cv::Mat D;
  /// undistorted image -> world plane, 3x3
  cv::Mat H;
};

// Throws std::runtime_error describing the first bad matrix.
void validate_coefficients(const CalibrationCoefficients& coeffs);

// ".json" goes through nlohmann::json (cam_intrinsic / cam_distcoeffs /
// homography), anything else through cv::FileStorage (K / D / H).
void save_coefficients(const CalibrationCoefficients& coeffs,
                       const std::string& path);
CalibrationCoefficients load_coefficients(const std::string& path);
