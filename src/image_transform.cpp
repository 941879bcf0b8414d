// Undistortion and reference-plane warp (Bird-eye View preprocessing)
// Copyright (c) 2025, Algorithm Development Team. All rights reserved.
//
// This software was developed of Jacob.lsx

#include "image_transform.h"

#include "image_io.h"

#include <Eigen/Dense>
#include <opencv2/core/eigen.hpp>
#include <fmt/format.h>

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

ImageTransformer::ImageTransformer(const CalibrationCoefficients& coeffs,
                                   WarpInfo warp_info)
    : coeffs_(coeffs), warp_info_(warp_info) {
  validate_coefficients(coeffs_);
  if (warp_info_.width <= 0 || warp_info_.height <= 0)
    throw std::runtime_error("Warp output size must be positive");
}

ImageTransformer::ImageTransformer(const std::string& calibration_path,
                                   WarpInfo warp_info)
    : ImageTransformer(load_coefficients(calibration_path), warp_info) {}

cv::Mat ImageTransformer::Undistort(const cv::Mat& image) const {
  cv::Mat img_undist;
  cv::undistort(image, img_undist, coeffs_.K, coeffs_.D);
  return img_undist;
}

cv::Mat ImageTransformer::Warp(const cv::Mat& undistorted) const {
  cv::Mat warped;
  cv::warpPerspective(undistorted, warped, coeffs_.H,
                      cv::Size(warp_info_.width, warp_info_.height),
                      warp_info_.interpolation);
  return warped;
}

cv::Mat ImageTransformer::Preprocess(const cv::Mat& image) const {
  return Warp(Undistort(image));
}

cv::Mat ImageTransformer::Preprocess(const std::string& image_path) const {
  return Preprocess(im_read(image_path));
}

std::vector<std::string>
ImageTransformer::BatchPreprocess(const std::string& input_dir,
                                  const std::string& output_dir) const {
  if (!fs::exists(output_dir))
    fs::create_directories(output_dir);

  std::vector<std::string> written;
  auto images = list_images(input_dir, batch_image_extensions());
  for (const auto& image_path : images) {
    auto output_path =
        (fs::path(output_dir) / fs::path(image_path).filename()).string();
    im_write(output_path, Preprocess(image_path));
    fmt::print("Processed image saved to {}\n", output_path);
    written.push_back(output_path);
  }
  return written;
}

cv::Point2d ImageTransformer::ImageToWorld(const cv::Point2d& uv) const {
  Eigen::Matrix3d H;
  cv::cv2eigen(coeffs_.H, H);

  Eigen::Vector3d point_uv(uv.x, uv.y, 1.0);
  Eigen::Vector2d xy = (H * point_uv).hnormalized();
  return cv::Point2d(xy(0), xy(1));
}

std::vector<cv::Point2d>
ImageTransformer::ImageToWorld(const std::vector<cv::Point2d>& uv) const {
  Eigen::Matrix3d H;
  cv::cv2eigen(coeffs_.H, H);

  std::vector<cv::Point2d> rst;
  rst.reserve(uv.size());
  for (auto& item : uv) {
    Eigen::Vector2d xy = (H * Eigen::Vector3d(item.x, item.y, 1.0)).hnormalized();
    rst.emplace_back(xy(0), xy(1));
  }
  return rst;
}
