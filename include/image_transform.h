// Undistortion and reference-plane warp (Bird-eye View preprocessing)
// Copyright (c) 2025, Algorithm Development Team. All rights reserved.
//
// This software was developed of Jacob.lsx
#ifndef IMAGE_TRANSFORM_H_
#define IMAGE_TRANSFORM_H_

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <string>
#include <vector>

#include "coeff_store.h"

class ImageTransformer {
public:
  struct WarpInfo {
    // output image width in world-plane units (1 unit -> 1 pixel)
    int width;
    // output image height
    int height;
    // cv::InterpolationFlags used by the warp
    int interpolation;

    WarpInfo() {
      width = 640;
      height = 480;
      interpolation = cv::INTER_LINEAR;
    }
    WarpInfo(int w, int h) : WarpInfo() {
      width = w;
      height = h;
    }
  };

  ImageTransformer() = delete;
  explicit ImageTransformer(const CalibrationCoefficients& coeffs,
                            WarpInfo warp_info = WarpInfo());
  explicit ImageTransformer(const std::string& calibration_path,
                            WarpInfo warp_info = WarpInfo());

  cv::Mat Undistort(const cv::Mat& image) const;
  cv::Mat Warp(const cv::Mat& undistorted) const;
  // Undistort followed by Warp.
  cv::Mat Preprocess(const cv::Mat& image) const;
  cv::Mat Preprocess(const std::string& image_path) const;

  // Reads every batch-set image in input_dir, writes the preprocessed result
  // under the same file name in output_dir (created if missing). Returns the
  // written paths.
  std::vector<std::string> BatchPreprocess(const std::string& input_dir,
                                           const std::string& output_dir) const;

  // Undistorted image pixel -> world plane coordinates through H.
  cv::Point2d ImageToWorld(const cv::Point2d& uv) const;
  std::vector<cv::Point2d>
  ImageToWorld(const std::vector<cv::Point2d>& uv) const;

private:
  CalibrationCoefficients coeffs_;
  WarpInfo warp_info_;
};

#endif // IMAGE_TRANSFORM_H_
