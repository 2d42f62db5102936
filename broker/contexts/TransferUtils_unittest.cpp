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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <numeric>
#include <vector>

#include "TransferUtils.h"

namespace gfxbroker {
namespace {

using ::testing::Each;
using ::testing::ElementsAreArray;

// Splits one buffer into uneven chunks so copies have to cross iovec boundaries.
IovecList chunked(std::vector<uint8_t>& storage, std::vector<size_t> chunkSizes) {
    IovecList iovs;
    size_t offset = 0;
    for (size_t chunk : chunkSizes) {
        iovs.push_back(iovec{storage.data() + offset, chunk});
        offset += chunk;
    }
    return iovs;
}

TEST(TransferUtilsTest, TotalSizeSumsChunks) {
    std::vector<uint8_t> storage(100);
    EXPECT_EQ(iovecsTotalSize(chunked(storage, {10, 30, 60})), 100u);
    EXPECT_EQ(iovecsTotalSize(IovecList{}), 0u);
}

TEST(TransferUtilsTest, CopyAcrossChunkBoundaries) {
    std::vector<uint8_t> storage(64);
    std::iota(storage.begin(), storage.end(), 0);
    IovecList iovs = chunked(storage, {7, 13, 44});

    std::vector<uint8_t> out(20);
    ASSERT_TRUE(copyFromIovecs(iovs, 5, out.data(), out.size()));
    std::vector<uint8_t> expected(20);
    std::iota(expected.begin(), expected.end(), 5);
    EXPECT_THAT(out, ElementsAreArray(expected));

    std::vector<uint8_t> ones(10, 1);
    ASSERT_TRUE(copyToIovecs(iovs, 3, ones.data(), ones.size()));
    EXPECT_THAT(std::vector<uint8_t>(storage.begin() + 3, storage.begin() + 13), Each(1));
    EXPECT_EQ(storage[13], 13);
}

TEST(TransferUtilsTest, CopyOutOfRangeFails) {
    std::vector<uint8_t> storage(16);
    IovecList iovs = chunked(storage, {8, 8});
    std::vector<uint8_t> out(8);
    EXPECT_FALSE(copyFromIovecs(iovs, 9, out.data(), out.size()));
    EXPECT_FALSE(copyFromIovecs(iovs, 17, out.data(), 0));
    EXPECT_TRUE(copyFromIovecs(iovs, 16, out.data(), 0));
}

TEST(TransferUtilsTest, RectangleToHostUsesGuestStride) {
    // 4x4 host image, guest rows padded to 24 bytes.
    std::vector<uint8_t> guestStorage(24 * 4, 0);
    for (uint32_t row = 0; row < 4; ++row) {
        for (uint32_t i = 0; i < 16; ++i) {
            guestStorage[row * 24 + i] = static_cast<uint8_t>(row + 1);
        }
    }
    IovecList guest = chunked(guestStorage, {50, 46});
    std::vector<uint8_t> host(4 * 4 * 4, 0);

    Transfer2D xfer{.x = 1, .y = 1, .w = 2, .h = 2, .bpp = 4, .hostWidth = 4, .hostHeight = 4,
                    .guestStride = 24, .guestOffset = 24};
    ASSERT_EQ(transfer2DToHost(xfer, guest, host.data(), host.size()), BrokerResult::kOk);

    // Row 1 of the host gets guest row 1 (value 2) in pixels 1 and 2 only.
    EXPECT_EQ(host[16 + 0], 0);
    EXPECT_EQ(host[16 + 4], 2);
    EXPECT_EQ(host[16 + 11], 2);
    EXPECT_EQ(host[16 + 12], 0);
    EXPECT_EQ(host[32 + 4], 3);
    EXPECT_EQ(host[48 + 4], 0);
}

TEST(TransferUtilsTest, RectangleFromHostRoundTripsPackedRows) {
    std::vector<uint8_t> host(2 * 2 * 4);
    std::iota(host.begin(), host.end(), 0);
    std::vector<uint8_t> guestStorage(host.size(), 0xff);
    IovecList guest = chunked(guestStorage, {3, 13});

    Transfer2D xfer{.w = 2, .h = 2, .hostWidth = 2, .hostHeight = 2};
    ASSERT_EQ(transfer2DFromHost(xfer, host.data(), host.size(), guest), BrokerResult::kOk);
    EXPECT_THAT(guestStorage, ElementsAreArray(host));
}

TEST(TransferUtilsTest, MalformedRectanglesAreRejected) {
    std::vector<uint8_t> guestStorage(64);
    IovecList guest = chunked(guestStorage, {64});
    std::vector<uint8_t> host(64);

    Transfer2D outside{.x = 3, .w = 2, .h = 1, .hostWidth = 4, .hostHeight = 4};
    EXPECT_EQ(transfer2DToHost(outside, guest, host.data(), host.size()),
              BrokerResult::kInvalidArgument);

    Transfer2D shortStride{.w = 4, .h = 2, .hostWidth = 4, .hostHeight = 4, .guestStride = 8};
    EXPECT_EQ(transfer2DToHost(shortStride, guest, host.data(), host.size()),
              BrokerResult::kInvalidArgument);

    Transfer2D pastBacking{.w = 4, .h = 4, .hostWidth = 4, .hostHeight = 4, .guestOffset = 1};
    EXPECT_EQ(transfer2DToHost(pastBacking, guest, host.data(), host.size()),
              BrokerResult::kInvalidArgument);

    Transfer2D empty{.w = 0, .h = 4, .hostWidth = 4, .hostHeight = 4};
    EXPECT_EQ(transfer2DToHost(empty, guest, host.data(), host.size()), BrokerResult::kOk);
}

}  // namespace
}  // namespace gfxbroker
