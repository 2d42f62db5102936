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

#include <gtest/gtest.h>

#include "VirtioGpuFormats.h"

namespace gfxbroker {
namespace {

TEST(VirtioGpuFormatsTest, PackedFormatsHaveKnownBpp) {
    EXPECT_EQ(virgl_format_bpp(kVirglFormatB8G8R8A8Unorm), 4u);
    EXPECT_EQ(virgl_format_bpp(kVirglFormatB5G6R5Unorm), 2u);
    EXPECT_EQ(virgl_format_bpp(kVirglFormatR8Unorm), 1u);
    EXPECT_FALSE(virgl_format_bpp(kVirglFormatNV12).has_value());
    EXPECT_FALSE(virgl_format_bpp(0xdead).has_value());
}

TEST(VirtioGpuFormatsTest, YuvFormatsAreNot2dCompatible) {
    EXPECT_TRUE(virgl_format_is_yuv(kVirglFormatYV12));
    EXPECT_FALSE(virgl_format_is_2d_compatible(kVirglFormatNV12));
    EXPECT_FALSE(virgl_format_is_2d_compatible(kVirglFormatB5G6R5Unorm));
    EXPECT_TRUE(virgl_format_is_2d_compatible(kVirglFormatR8G8B8X8Unorm));
    EXPECT_FALSE(virgl_format_is_yuv(kVirglFormatB8G8R8A8Unorm));
}

TEST(VirtioGpuFormatsTest, DrmFormatBpp) {
    EXPECT_EQ(drm_format_bpp(kDrmFormatRgb565), 2u);
    EXPECT_EQ(drm_format_bpp(kDrmFormatArgb8888), 4u);
    EXPECT_FALSE(drm_format_bpp(kDrmFormatNv12).has_value());
}

TEST(VirtioGpuFormatsTest, TransferLength) {
    EXPECT_EQ(virgl_format_to_total_xfer_len(kVirglFormatB8G8R8A8Unorm, 64, 64, 4, 2),
              256u + 16u);
    EXPECT_EQ(virgl_format_to_total_xfer_len(kVirglFormatB8G8R8A8Unorm, 64, 64, 0, 2), 0u);
    // NV12: full-size luma plane plus an interleaved half-height chroma plane.
    EXPECT_EQ(virgl_format_to_total_xfer_len(kVirglFormatNV12, 16, 8, 16, 8), 16u * 8u + 16u * 4u);
    EXPECT_FALSE(virgl_format_to_total_xfer_len(0xdead, 16, 8, 16, 8).has_value());
}

TEST(VirtioGpuFormatsTest, AlignUp) {
    EXPECT_EQ(align_up(17, 16), 32u);
    EXPECT_EQ(align_up(32, 16), 32u);
    EXPECT_EQ(align_up_64(65, 64), 128u);
}

}  // namespace
}  // namespace gfxbroker
