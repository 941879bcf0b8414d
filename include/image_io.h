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
#include <vector>

// Extensions picked up by batch preprocessing (lowercase, with dot).
const std::vector<std::string>& batch_image_extensions();

// Files matching <dir>/*.<image_format>, sorted. A trailing '/' on dir and a
// leading '.' on image_format are both accepted.
std::vector<std::string> list_images(const std::string& dir,
                                     const std::string& image_format);

// Files whose lowercase name ends with one of the given extensions, sorted.
std::vector<std::string>
list_images(const std::string& dir, const std::vector<std::string>& extensions);

// BGR image, throws std::runtime_error if the file cannot be decoded.
cv::Mat im_read(const std::string& file_path);

void im_write(const std::string& file_path, const cv::Mat& image);
