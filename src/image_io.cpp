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

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

const std::vector<std::string>& batch_image_extensions() {
  static const std::vector<std::string> extensions = {".png", ".jpg", ".jpeg",
                                                      ".bmp", ".tiff"};
  return extensions;
}

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

static fs::path checked_dir(const std::string& dir) {
  std::string d = dir;
  while (d.size() > 1 && d.back() == '/') {
    d.pop_back();
  }
  fs::path p(d);
  if (!fs::is_directory(p)) {
    throw std::runtime_error("Not a directory: " + dir);
  }
  return p;
}

std::vector<std::string> list_images(const std::string& dir,
                                     const std::string& image_format) {
  auto root = checked_dir(dir);
  std::string ext = image_format;
  if (!ext.starts_with(".")) {
    ext = "." + ext;
  }

  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(root)) {
    if (entry.is_regular_file() && entry.path().extension() == ext) {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::string>
list_images(const std::string& dir, const std::vector<std::string>& extensions) {
  auto root = checked_dir(dir);

  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(root)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    auto name = to_lower(entry.path().filename().string());
    for (const auto& ext : extensions) {
      if (name.ends_with(ext)) {
        files.push_back(entry.path().string());
        break;
      }
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

cv::Mat im_read(const std::string& file_path) {
  cv::Mat bgr = cv::imread(file_path, cv::IMREAD_COLOR);
  if (bgr.empty()) {
    throw std::runtime_error("Cannot read image: " + file_path);
  }
  return bgr;
}

void im_write(const std::string& file_path, const cv::Mat& image) {
  if (!cv::imwrite(file_path, image)) {
    throw std::runtime_error("Cannot write image: " + file_path);
  }
}
