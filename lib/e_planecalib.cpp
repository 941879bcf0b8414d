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

#include "e_planecalib.h"

#include "calibrator.h"
#include "homography.h"
#include "image_transform.h"

#include <fmt/format.h>

CalibrationReport run_calibration(const CalibrationRequest& request) {
  auto calibrator =
      ChessboardCalibrator(request.pattern_size, request.square_size);
  calibrator.set_debug_dir(request.debug_dir);
  auto res = calibrator.calibrate(request.dirpath, request.image_format);

  auto finder = PlaneHomographyFinder(res.K, res.dist);
  auto homography =
      finder.from_chessboard(request.ref_plan_path, request.pattern_size,
                             request.square_size, request.origin);

  CalibrationReport report;
  report.rms = res.rms;
  report.coeffs = {res.K, res.dist, homography.H};
  report.rvecs = res.rvecs;
  report.tvecs = res.tvecs;
  report.used_files = res.used_files;
  report.rejected_files = res.rejected_files;

  save_coefficients(report.coeffs, request.save_to);
  fmt::print("Calibration saved to {}\n", request.save_to);
  return report;
}

cv::Mat preprocess(const CalibrationCoefficients& coeffs, const cv::Mat& im,
                   const cv::Size& output_size) {
  auto transformer = ImageTransformer(
      coeffs, ImageTransformer::WarpInfo(output_size.width, output_size.height));
  return transformer.Preprocess(im);
}
