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

#include "SoftwareBackend.h"
#include "VirtioGpuFormats.h"

namespace gfxbroker {
namespace {

using ::testing::Each;
using ::testing::ElementsAreArray;

ResourceCreateArgs make2D(uint32_t width, uint32_t height,
                          uint32_t format = kVirglFormatB8G8R8A8Unorm) {
    ResourceCreateArgs args;
    args.format = format;
    args.width = width;
    args.height = height;
    return args;
}

class SoftwareBackendTest : public ::testing::Test {
   protected:
    SoftwareBackend mBackend;
};

TEST_F(SoftwareBackendTest, HasNoCapsetsOrContexts) {
    EXPECT_TRUE(mBackend.capsets().empty());
    std::unique_ptr<BackendContext> context;
    EXPECT_EQ(mBackend.createContext(1, kCapsetVirgl, "ctx", &context),
              BrokerResult::kUnsupported);
}

TEST_F(SoftwareBackendTest, CreateResourceValidatesFormatAndLayout) {
    BackendResource out;
    EXPECT_EQ(mBackend.createResource(1, make2D(4, 4), &out), BrokerResult::kOk);
    EXPECT_EQ(out.size, 64u);
    EXPECT_EQ(out.mapping.hva, nullptr);

    EXPECT_EQ(mBackend.createResource(2, make2D(4, 4, kVirglFormatNV12), &out),
              BrokerResult::kUnsupported);
    EXPECT_EQ(mBackend.createResource(3, make2D(0, 4), &out), BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBackend.createResource(4, make2D(65536, 65536), &out),
              BrokerResult::kInvalidArgument);

    ResourceCreateArgs volume = make2D(4, 4);
    volume.depth = 2;
    EXPECT_EQ(mBackend.createResource(5, volume, &out), BrokerResult::kUnsupported);
}

TEST_F(SoftwareBackendTest, TransferRoundTripThroughBacking) {
    BackendResource out;
    ASSERT_EQ(mBackend.createResource(1, make2D(2, 2), &out), BrokerResult::kOk);

    std::vector<uint8_t> pages(16);
    std::iota(pages.begin(), pages.end(), 1);
    ASSERT_EQ(mBackend.attachBacking(1, {iovec{pages.data(), 5}, iovec{pages.data() + 5, 11}}),
              BrokerResult::kOk);

    TransferBox box{.w = 2, .h = 2};
    ASSERT_EQ(mBackend.transferToHost(kNoContext, 1, box), BrokerResult::kOk);

    std::vector<uint8_t> readback(16, 0);
    IovecList dst{iovec{readback.data(), readback.size()}};
    ASSERT_EQ(mBackend.transferFromHost(kNoContext, 1, box, &dst), BrokerResult::kOk);
    EXPECT_THAT(readback, ElementsAreArray(pages));
}

TEST_F(SoftwareBackendTest, TransferWithoutBackingIsRejected) {
    BackendResource out;
    ASSERT_EQ(mBackend.createResource(1, make2D(2, 2), &out), BrokerResult::kOk);
    TransferBox box{.w = 1, .h = 1};
    EXPECT_EQ(mBackend.transferToHost(kNoContext, 1, box), BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBackend.transferToHost(kNoContext, 1, TransferBox{}), BrokerResult::kOk);
    EXPECT_EQ(mBackend.transferToHost(kNoContext, 9, box), BrokerResult::kNotFound);
}

TEST_F(SoftwareBackendTest, OutOfBoundsBoxIsRejected) {
    BackendResource out;
    ASSERT_EQ(mBackend.createResource(1, make2D(2, 2), &out), BrokerResult::kOk);
    std::vector<uint8_t> pages(16);
    ASSERT_EQ(mBackend.attachBacking(1, {iovec{pages.data(), pages.size()}}), BrokerResult::kOk);
    TransferBox box{.x = 1, .w = 2, .h = 1};
    EXPECT_EQ(mBackend.transferToHost(kNoContext, 1, box), BrokerResult::kInvalidArgument);
}

TEST_F(SoftwareBackendTest, GuestBlobsOnly) {
    std::vector<uint8_t> pages(64);
    IovecList iovecs{iovec{pages.data(), pages.size()}};
    BackendResource out;

    BlobCreateArgs host{.blobMem = kBlobMemHost3d, .size = 64};
    EXPECT_EQ(mBackend.createBlob(1, host, {}, &out), BrokerResult::kUnsupported);

    BlobCreateArgs tooBig{.blobMem = kBlobMemGuest, .size = 128};
    EXPECT_EQ(mBackend.createBlob(2, tooBig, iovecs, &out), BrokerResult::kInvalidArgument);

    BlobCreateArgs guest{.blobMem = kBlobMemGuest, .size = 64};
    EXPECT_EQ(mBackend.createBlob(3, guest, iovecs, &out), BrokerResult::kOk);
    EXPECT_EQ(out.size, 64u);
}

TEST_F(SoftwareBackendTest, GuestBlobReadBackUsesScanoutStride) {
    // 2x2 image stored with a 12 byte stride.
    std::vector<uint8_t> pages(24, 0);
    for (int row = 0; row < 2; ++row) {
        for (int i = 0; i < 8; ++i) {
            pages[row * 12 + i] = static_cast<uint8_t>(row + 1);
        }
    }
    BackendResource out;
    BlobCreateArgs guest{.blobMem = kBlobMemGuest, .size = pages.size()};
    ASSERT_EQ(mBackend.createBlob(1, guest, {iovec{pages.data(), pages.size()}}, &out),
              BrokerResult::kOk);

    std::vector<uint8_t> readback(16, 0);
    IovecList dst{iovec{readback.data(), readback.size()}};
    TransferBox box{.w = 2, .h = 2};
    EXPECT_EQ(mBackend.transferFromHost(kNoContext, 1, box, &dst),
              BrokerResult::kInvalidArgument);

    mBackend.onScanoutBound(1, ScanoutInfo{.resourceId = 1,
                                           .width = 2,
                                           .height = 2,
                                           .format = kVirglFormatB8G8R8A8Unorm,
                                           .stride = 12});
    ASSERT_EQ(mBackend.transferFromHost(kNoContext, 1, box, &dst), BrokerResult::kOk);
    EXPECT_THAT(std::vector<uint8_t>(readback.begin(), readback.begin() + 8), Each(1));
    EXPECT_THAT(std::vector<uint8_t>(readback.begin() + 8, readback.end()), Each(2));
}

TEST_F(SoftwareBackendTest, DestroyForgetsResource) {
    BackendResource out;
    ASSERT_EQ(mBackend.createResource(1, make2D(1, 1), &out), BrokerResult::kOk);
    mBackend.destroyResource(1);
    EXPECT_EQ(mBackend.transferToHost(kNoContext, 1, TransferBox{.w = 1, .h = 1}),
              BrokerResult::kNotFound);
}

}  // namespace
}  // namespace gfxbroker
