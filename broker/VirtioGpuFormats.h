// Copyright 2023 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace gfxbroker {

// Gallium/virgl format values used on the virtio-gpu wire.
constexpr uint32_t kVirglFormatB8G8R8A8Unorm = 1;
constexpr uint32_t kVirglFormatB8G8R8X8Unorm = 2;
constexpr uint32_t kVirglFormatA8R8G8B8Unorm = 3;
constexpr uint32_t kVirglFormatX8R8G8B8Unorm = 4;
constexpr uint32_t kVirglFormatB5G6R5Unorm = 7;
constexpr uint32_t kVirglFormatR10G10B10A2Unorm = 8;
constexpr uint32_t kVirglFormatR8Unorm = 64;
constexpr uint32_t kVirglFormatR8G8Unorm = 65;
constexpr uint32_t kVirglFormatR8G8B8A8Unorm = 67;
constexpr uint32_t kVirglFormatX8B8G8R8Unorm = 68;
constexpr uint32_t kVirglFormatA8B8G8R8Unorm = 121;
constexpr uint32_t kVirglFormatR8G8B8X8Unorm = 134;
constexpr uint32_t kVirglFormatYV12 = 163;
constexpr uint32_t kVirglFormatNV12 = 166;
constexpr uint32_t kVirglFormatP010 = 314;

constexpr uint32_t fourcc(char a, char b, char c, char d) {
    return static_cast<uint32_t>(a) | (static_cast<uint32_t>(b) << 8) |
           (static_cast<uint32_t>(c) << 16) | (static_cast<uint32_t>(d) << 24);
}

constexpr uint32_t kDrmFormatArgb8888 = fourcc('A', 'R', '2', '4');
constexpr uint32_t kDrmFormatXrgb8888 = fourcc('X', 'R', '2', '4');
constexpr uint32_t kDrmFormatAbgr8888 = fourcc('A', 'B', '2', '4');
constexpr uint32_t kDrmFormatXbgr8888 = fourcc('X', 'B', '2', '4');
constexpr uint32_t kDrmFormatBgra8888 = fourcc('B', 'A', '2', '4');
constexpr uint32_t kDrmFormatBgrx8888 = fourcc('B', 'X', '2', '4');
constexpr uint32_t kDrmFormatRgba8888 = fourcc('R', 'A', '2', '4');
constexpr uint32_t kDrmFormatRgbx8888 = fourcc('R', 'X', '2', '4');
constexpr uint32_t kDrmFormatRgb565 = fourcc('R', 'G', '1', '6');
constexpr uint32_t kDrmFormatAbgr2101010 = fourcc('A', 'B', '3', '0');
constexpr uint32_t kDrmFormatR8 = fourcc('R', '8', ' ', ' ');
constexpr uint32_t kDrmFormatGr88 = fourcc('G', 'R', '8', '8');
constexpr uint32_t kDrmFormatNv12 = fourcc('N', 'V', '1', '2');

static inline uint32_t align_up(uint32_t n, uint32_t a) {
    return ((n + a - 1) / a) * a;
}

static inline uint64_t align_up_64(uint64_t n, uint64_t a) {
    return ((n + a - 1) / a) * a;
}

bool virgl_format_is_yuv(uint32_t format);

// Bytes per pixel of a packed format, or nullopt for planar and unknown formats.
std::optional<uint32_t> virgl_format_bpp(uint32_t format);

// True for the 32-bit formats the software 2D path can hold in its host shadow.
bool virgl_format_is_2d_compatible(uint32_t format);

// Bytes per pixel of a single-plane DRM format, or nullopt.
std::optional<uint32_t> drm_format_bpp(uint32_t drmFormat);

// Number of guest bytes a packed w x h transfer touches in a totalWidth x totalHeight image.
// YUV transfers always cover every plane.
std::optional<size_t> virgl_format_to_total_xfer_len(uint32_t format, uint32_t totalWidth,
                                                     uint32_t totalHeight, uint32_t w,
                                                     uint32_t h);

}  // namespace gfxbroker
