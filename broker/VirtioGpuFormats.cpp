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

#include "VirtioGpuFormats.h"

namespace gfxbroker {

bool virgl_format_is_yuv(uint32_t format) {
    switch (format) {
        case kVirglFormatNV12:
        case kVirglFormatP010:
        case kVirglFormatYV12:
            return true;
        default:
            return false;
    }
}

std::optional<uint32_t> virgl_format_bpp(uint32_t format) {
    switch (format) {
        case kVirglFormatB8G8R8A8Unorm:
        case kVirglFormatB8G8R8X8Unorm:
        case kVirglFormatA8R8G8B8Unorm:
        case kVirglFormatX8R8G8B8Unorm:
        case kVirglFormatR8G8B8A8Unorm:
        case kVirglFormatX8B8G8R8Unorm:
        case kVirglFormatA8B8G8R8Unorm:
        case kVirglFormatR8G8B8X8Unorm:
        case kVirglFormatR10G10B10A2Unorm:
            return 4;
        case kVirglFormatB5G6R5Unorm:
        case kVirglFormatR8G8Unorm:
            return 2;
        case kVirglFormatR8Unorm:
            return 1;
        default:
            return std::nullopt;
    }
}

bool virgl_format_is_2d_compatible(uint32_t format) {
    switch (format) {
        case kVirglFormatB8G8R8A8Unorm:
        case kVirglFormatB8G8R8X8Unorm:
        case kVirglFormatA8R8G8B8Unorm:
        case kVirglFormatX8R8G8B8Unorm:
        case kVirglFormatR8G8B8A8Unorm:
        case kVirglFormatX8B8G8R8Unorm:
        case kVirglFormatA8B8G8R8Unorm:
        case kVirglFormatR8G8B8X8Unorm:
            return true;
        default:
            return false;
    }
}

std::optional<uint32_t> drm_format_bpp(uint32_t drmFormat) {
    switch (drmFormat) {
        case kDrmFormatArgb8888:
        case kDrmFormatXrgb8888:
        case kDrmFormatAbgr8888:
        case kDrmFormatXbgr8888:
        case kDrmFormatBgra8888:
        case kDrmFormatBgrx8888:
        case kDrmFormatRgba8888:
        case kDrmFormatRgbx8888:
        case kDrmFormatAbgr2101010:
            return 4;
        case kDrmFormatRgb565:
        case kDrmFormatGr88:
            return 2;
        case kDrmFormatR8:
            return 1;
        default:
            return std::nullopt;
    }
}

std::optional<size_t> virgl_format_to_total_xfer_len(uint32_t format, uint32_t totalWidth,
                                                     uint32_t totalHeight, uint32_t w,
                                                     uint32_t h) {
    if (w == 0 || h == 0) {
        return 0;
    }
    if (virgl_format_is_yuv(format)) {
        size_t bpp = format == kVirglFormatP010 ? 2 : 1;
        size_t yStride = static_cast<size_t>(totalWidth) * bpp;
        size_t ySize = yStride * totalHeight;

        size_t uvWidth = totalWidth;
        size_t uvPlaneCount = 1;
        if (format == kVirglFormatYV12) {
            uvWidth = totalWidth / 2;
            uvPlaneCount = 2;
        }
        size_t uvHeight = totalHeight / 2;
        size_t uvStride = uvWidth * bpp;
        size_t uvSize = uvStride * uvHeight * uvPlaneCount;
        return ySize + uvSize;
    }

    auto bpp = virgl_format_bpp(format);
    if (!bpp) {
        return std::nullopt;
    }
    size_t stride = static_cast<size_t>(totalWidth) * *bpp;
    // The last row does not occupy the full stride.
    return (static_cast<size_t>(h) - 1U) * stride + static_cast<size_t>(w) * *bpp;
}

}  // namespace gfxbroker
