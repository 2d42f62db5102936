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

#include "StubBackend.h"

namespace gfxbroker {
namespace {

TEST(StubBackendTest, AdvertisesEmptyVendorCapset) {
    StubBackend backend;
    auto capsets = backend.capsets();
    ASSERT_EQ(capsets.size(), 1u);
    EXPECT_EQ(capsets[0].id, kCapsetMagma);
    EXPECT_EQ(capsets[0].version, 0u);
    EXPECT_TRUE(capsets[0].data.empty());
}

TEST(StubBackendTest, SubmitIsSignaledByTheBroker) {
    StubBackend backend;
    ASSERT_EQ(backend.initialize(nullptr), BrokerResult::kOk);
    std::unique_ptr<BackendContext> context;
    ASSERT_EQ(backend.createContext(1, kCapsetMagma, "vendor", &context), BrokerResult::kOk);
    EXPECT_EQ(context->componentType(), ComponentType::kStub);

    const uint8_t commands[] = {1, 2, 3};
    base::AsyncResult result;
    EXPECT_EQ(context->submit(CommandBuffer{commands, sizeof(commands)},
                              Fence{.id = 1, .ring = FenceRingContextSpecific{1, 0}}, &result),
              BrokerResult::kOk);
    EXPECT_EQ(result.Value(), base::AsyncResult::OK_AND_CALLBACK_NOT_SCHEDULED);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_FALSE(result.CallbackScheduledOrFired());
}

TEST(StubBackendTest, RejectsOtherCapsetsAndBlobs) {
    StubBackend backend;
    std::unique_ptr<BackendContext> context;
    EXPECT_EQ(backend.createContext(1, kCapsetVenus, "vendor", &context),
              BrokerResult::kUnsupported);

    BackendResource out;
    EXPECT_EQ(backend.createBlob(1, BlobCreateArgs{}, {}, &out), BrokerResult::kUnsupported);
}

TEST(StubBackendTest, ResourcesAreTrackedButNotBacked) {
    StubBackend backend;
    BackendResource out;
    ResourceCreateArgs args;
    args.width = 8;
    args.height = 2;
    ASSERT_EQ(backend.createResource(3, args, &out), BrokerResult::kOk);
    EXPECT_EQ(backend.transferToHost(kNoContext, 3, TransferBox{}), BrokerResult::kOk);
    backend.destroyResource(3);
    EXPECT_EQ(backend.transferToHost(kNoContext, 3, TransferBox{}), BrokerResult::kNotFound);
}

}  // namespace
}  // namespace gfxbroker
