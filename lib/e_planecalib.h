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

#ifdef _WIN32
    #ifdef BUILDING_E_PLANECALIB
        #define E_PLANECALIB_API __declspec(dllexport)
    #else
        #define E_PLANECALIB_API __declspec(dllimport)
    #endif
#else
    #define E_PLANECALIB_API __attribute__((visibility("default")))
#endif

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "coeff_store.h"

struct CalibrationRequest {
  std::string dirpath;
  std::string image_format;
  std::string ref_plan_path;
  float square_size = 25.f;
  cv::Size pattern_size = cv::Size(10, 7);
  cv::Point2f origin = cv::Point2f(25.f, 25.f);
  std::string save_to = "./calibration.yml";
  std::string debug_dir;
};

struct CalibrationReport {
  double rms = 0.0;
  CalibrationCoefficients coeffs;
  std::vector<cv::Mat> rvecs;
  std::vector<cv::Mat> tvecs;
  std::vector<std::string> used_files;
  std::vector<std::string> rejected_files;
};

// Calibrates from request.dirpath, solves the reference plane homography from
// request.ref_plan_path and saves {K, D, H} to request.save_to.
E_PLANECALIB_API CalibrationReport run_calibration(const CalibrationRequest& request);

E_PLANECALIB_API cv::Mat preprocess(const CalibrationCoefficients& coeffs,
                                    const cv::Mat& im,
                                    const cv::Size& output_size = cv::Size(640, 480));
