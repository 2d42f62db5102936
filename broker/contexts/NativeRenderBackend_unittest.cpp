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
#include <unistd.h>

#include <vector>

#include "NativeRenderBackend.h"
#include "tests/MockNativeRenderer.h"

namespace gfxbroker {
namespace {

using ::testing::_;
using ::testing::DoAll;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::SetArgPointee;

class RecordingHost : public BackendHost {
   public:
    BrokerResult signalFence(const FenceRing& ring, FenceId id) override {
        signaled.push_back(FenceCompletion{.id = id, .ring = ring});
        return BrokerResult::kOk;
    }
    BrokerResult lookupResource(ResourceId, ResourceInfo*) const override {
        return BrokerResult::kNotFound;
    }
    BrokerResult duplicateResourceHandle(ResourceId, android::base::ManagedDescriptor*,
                                         uint32_t*) override {
        return BrokerResult::kNotFound;
    }

    std::vector<FenceCompletion> signaled;
};

class NativeRenderBackendTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto renderer = std::make_unique<NiceMock<MockNativeRenderer>>();
        mRenderer = renderer.get();
        mBackend = std::make_unique<NativeRenderBackend>(std::move(renderer));
        ASSERT_EQ(mBackend->initialize(&mHost), BrokerResult::kOk);
    }

    void TearDown() override {
        EXPECT_CALL(*mRenderer, finish()).Times(1);
        mBackend.reset();
    }

    RecordingHost mHost;
    NiceMock<MockNativeRenderer>* mRenderer = nullptr;
    std::unique_ptr<NativeRenderBackend> mBackend;
};

TEST(NativeRenderBackendResultTest, MapsVkResults) {
    EXPECT_EQ(brokerResultFromVkResult(VK_SUCCESS), BrokerResult::kOk);
    EXPECT_EQ(brokerResultFromVkResult(VK_ERROR_FORMAT_NOT_SUPPORTED), BrokerResult::kUnsupported);
    EXPECT_EQ(brokerResultFromVkResult(VK_ERROR_FEATURE_NOT_PRESENT), BrokerResult::kUnsupported);
    EXPECT_EQ(brokerResultFromVkResult(VK_ERROR_EXTENSION_NOT_PRESENT),
              BrokerResult::kUnsupported);
    EXPECT_EQ(brokerResultFromVkResult(VK_ERROR_DEVICE_LOST), BrokerResult::kBackendFailure);
    EXPECT_EQ(brokerResultFromVkResult(VK_ERROR_OUT_OF_HOST_MEMORY),
              BrokerResult::kBackendFailure);
}

TEST(NativeRenderBackendDeathTest, NullRendererAborts) {
    EXPECT_DEATH({ NativeRenderBackend backend(nullptr); },
                 R"re(native render component created without a renderer)re");
}

TEST_F(NativeRenderBackendTest, CapsetsComeFromTheRenderer) {
    EXPECT_CALL(*mRenderer, capsets())
        .WillOnce(Return(std::vector<CapsetDescriptor>{
            CapsetDescriptor{.id = kCapsetGfxstreamVulkan, .version = 1, .data = {1, 2}}}));
    auto capsets = mBackend->capsets();
    ASSERT_EQ(capsets.size(), 1u);
    EXPECT_EQ(capsets[0].id, kCapsetGfxstreamVulkan);
}

TEST_F(NativeRenderBackendTest, SubmitCompletesThroughGpuCallback) {
    EXPECT_CALL(*mRenderer, createContext(4, kCapsetGfxstreamVulkan, Eq("app")))
        .WillOnce(Return(VK_SUCCESS));
    std::unique_ptr<BackendContext> context;
    ASSERT_EQ(mBackend->createContext(4, kCapsetGfxstreamVulkan, "app", &context),
              BrokerResult::kOk);

    const uint8_t commands[] = {0xaa, 0xbb};
    NativeRenderer::CompletionCallback callback;
    EXPECT_CALL(*mRenderer, submitCommands(4, commands, sizeof(commands)))
        .WillOnce(Return(VK_SUCCESS));
    EXPECT_CALL(*mRenderer, asyncWaitForGpu(4, 2, _)).WillOnce(SaveArg<2>(&callback));

    const Fence fence{.id = 17, .ring = FenceRingContextSpecific{.ctxId = 4, .ringIdx = 2}};
    base::AsyncResult result;
    ASSERT_EQ(context->submit(CommandBuffer{commands, sizeof(commands)}, fence, &result),
              BrokerResult::kOk);
    EXPECT_EQ(result.Value(), base::AsyncResult::OK_AND_CALLBACK_SCHEDULED);
    EXPECT_TRUE(mHost.signaled.empty());

    ASSERT_TRUE(callback);
    callback();
    ASSERT_EQ(mHost.signaled.size(), 1u);
    EXPECT_EQ(mHost.signaled[0].id, 17u);
    EXPECT_EQ(mHost.signaled[0].ring, fence.ring);

    EXPECT_CALL(*mRenderer, destroyContext(4)).Times(1);
    context.reset();
}

TEST_F(NativeRenderBackendTest, SubmitFailureIsPropagated) {
    ON_CALL(*mRenderer, createContext(_, _, _)).WillByDefault(Return(VK_SUCCESS));
    std::unique_ptr<BackendContext> context;
    ASSERT_EQ(mBackend->createContext(1, kCapsetGfxstreamVulkan, "", &context), BrokerResult::kOk);

    EXPECT_CALL(*mRenderer, submitCommands(1, _, _)).WillOnce(Return(VK_ERROR_DEVICE_LOST));
    EXPECT_CALL(*mRenderer, asyncWaitForGpu(_, _, _)).Times(0);
    base::AsyncResult result;
    Fence fence{.id = 1, .ring = FenceRingContextSpecific{1, 0}};
    EXPECT_EQ(context->submit(CommandBuffer{}, fence, &result),
              BrokerResult::kBackendFailure);
    EXPECT_FALSE(result.Succeeded());
}

TEST_F(NativeRenderBackendTest, CreateContextFailureMapsToUnsupported) {
    EXPECT_CALL(*mRenderer, createContext(_, _, _))
        .WillOnce(Return(VK_ERROR_EXTENSION_NOT_PRESENT));
    std::unique_ptr<BackendContext> context;
    EXPECT_EQ(mBackend->createContext(1, kCapsetVenus, "", &context), BrokerResult::kUnsupported);
    EXPECT_EQ(context, nullptr);
}

TEST_F(NativeRenderBackendTest, HostBlobReportsMapping) {
    static uint8_t hostMemory[4096];
    EXPECT_CALL(*mRenderer, createBlob(9, _, _, _))
        .WillOnce(DoAll(SetArgPointee<3>(NativeBlob{.hva = hostMemory,
                                                     .size = sizeof(hostMemory),
                                                     .mapInfo = kMapCacheCached}),
                        Return(VK_SUCCESS)));
    BackendResource out;
    BlobCreateArgs args{.blobMem = kBlobMemHost3d, .blobFlags = kBlobFlagUseMappable,
                        .blobId = 1, .size = sizeof(hostMemory)};
    ASSERT_EQ(mBackend->createBlob(9, args, {}, &out), BrokerResult::kOk);
    EXPECT_EQ(out.mapping.hva, hostMemory);
    EXPECT_EQ(out.mapInfo, kMapCacheCached);
    EXPECT_EQ(out.size, sizeof(hostMemory));
}

TEST_F(NativeRenderBackendTest, ExportWrapsTheDescriptor) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[1]);
    EXPECT_CALL(*mRenderer, exportBlob(3, _, _))
        .WillOnce(DoAll(SetArgPointee<1>(fds[0]), SetArgPointee<2>(kMemHandleTypeOpaqueFd),
                        Return(VK_SUCCESS)));
    ExportedDescriptor exported;
    ASSERT_EQ(mBackend->exportResource(3, &exported), BrokerResult::kOk);
    EXPECT_EQ(exported.descriptor.get(), fds[0]);
    EXPECT_EQ(exported.handleType, kMemHandleTypeOpaqueFd);
}

TEST_F(NativeRenderBackendTest, UnmapIsForwarded) {
    EXPECT_CALL(*mRenderer, unmapBlob(3)).WillOnce(Return(VK_SUCCESS));
    EXPECT_CALL(*mRenderer, unmapBlob(4)).WillOnce(Return(VK_ERROR_MEMORY_MAP_FAILED));
    EXPECT_EQ(mBackend->unmapResource(3), BrokerResult::kOk);
    EXPECT_NE(mBackend->unmapResource(4), BrokerResult::kOk);
}

TEST_F(NativeRenderBackendTest, FencesExportAsSyncFiles) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[1]);
    EXPECT_CALL(*mRenderer, exportSyncFd(2, 1, _))
        .WillOnce(DoAll(SetArgPointee<2>(fds[0]), Return(VK_SUCCESS)))
        .WillOnce(DoAll(SetArgPointee<2>(-1), Return(VK_SUCCESS)));
    ExportedDescriptor exported;
    ASSERT_EQ(mBackend->exportFence(2, 1, 9, &exported), BrokerResult::kOk);
    EXPECT_EQ(exported.descriptor.get(), fds[0]);
    EXPECT_EQ(exported.handleType, kFenceHandleTypeSyncFd);

    ExportedDescriptor missing;
    EXPECT_EQ(mBackend->exportFence(2, 1, 10, &missing), BrokerResult::kBackendFailure);
}

TEST_F(NativeRenderBackendTest, TransfersAreForwarded) {
    TransferBox box{.w = 4, .h = 4};
    EXPECT_CALL(*mRenderer, transferWrite(2, 5, _)).WillOnce(Return(VK_SUCCESS));
    EXPECT_CALL(*mRenderer, transferRead(2, 5, _, nullptr)).WillOnce(Return(VK_ERROR_DEVICE_LOST));
    EXPECT_EQ(mBackend->transferToHost(2, 5, box), BrokerResult::kOk);
    EXPECT_EQ(mBackend->transferFromHost(2, 5, box, nullptr), BrokerResult::kBackendFailure);
}

}  // namespace
}  // namespace gfxbroker
