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
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <mutex>
#include <vector>

#include "Broker.h"
#include "BrokerBuilder.h"
#include "VirtioGpuFormats.h"
#include "contexts/CrossDomainBackend.h"
#include "contexts/SoftwareBackend.h"
#include "contexts/StubBackend.h"
#include "tests/MockBackend.h"

namespace gfxbroker {
namespace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

constexpr uint32_t kWidth = 64;
constexpr uint32_t kHeight = 32;

ResourceCreateArgs displayArgs(ContextId ctxId = kNoContext) {
    ResourceCreateArgs args;
    args.ctxId = ctxId;
    args.format = kVirglFormatB8G8R8X8Unorm;
    args.width = kWidth;
    args.height = kHeight;
    return args;
}

class BrokerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto native = makeMockBackend(ComponentType::kNativeRender,
                                      {CapsetDescriptor{.id = kCapsetGfxstreamVulkan,
                                                        .version = 1,
                                                        .data = {1, 2, 3, 4}}});
        mNative = native.get();
        ON_CALL(*mNative, createContext(_, _, _, _))
            .WillByDefault(Invoke([this](ContextId, uint32_t, const std::string&,
                                         std::unique_ptr<BackendContext>* out) {
                auto context = std::make_unique<NiceMock<MockBackendContext>>();
                ON_CALL(*context, componentType())
                    .WillByDefault(Return(ComponentType::kNativeRender));
                ON_CALL(*context, attachResource(_)).WillByDefault(Return(BrokerResult::kOk));
                ON_CALL(*context, submit(_, _, _))
                    .WillByDefault(Invoke(
                        [](const CommandBuffer&, const Fence&, base::AsyncResult* result) {
                            *result = base::AsyncResult::OK_AND_CALLBACK_SCHEDULED;
                            return BrokerResult::kOk;
                        }));
                mLastContext = context.get();
                *out = std::move(context);
                return BrokerResult::kOk;
            }));

        BrokerConfig config;
        config.numScanouts = 2;
        config.fenceCallback = [this](const FenceCompletion& completion) {
            std::lock_guard<std::mutex> lock(mCompletionsMutex);
            mCompletions.push_back(completion.id);
        };
        BrokerBuilder builder(config);
        builder.addBackend(std::make_unique<SoftwareBackend>())
            .addBackend(std::move(native))
            .addBackend(std::make_unique<CrossDomainBackend>(
                1u << kCrossDomainChannelTypeWayland,
                [this](uint32_t, android::base::ManagedDescriptor* outChannel) {
                    int fds[2];
                    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
                        return BrokerResult::kBackendFailure;
                    }
                    *outChannel = android::base::ManagedDescriptor(fds[0]);
                    mChannelPeer = android::base::ManagedDescriptor(fds[1]);
                    return BrokerResult::kOk;
                }))
            .addBackend(std::make_unique<StubBackend>());
        ASSERT_EQ(builder.build(&mBroker), BrokerResult::kOk);
    }

    ContextId createNativeContext() {
        ContextId ctx = kNoContext;
        EXPECT_EQ(mBroker->createContext(kCapsetGfxstreamVulkan, 1, std::nullopt, "vk", &ctx),
                  BrokerResult::kOk);
        return ctx;
    }

    ResourceId createDisplayResource() {
        ResourceId id = kInvalidResourceId;
        EXPECT_EQ(mBroker->createResource(displayArgs(), &id), BrokerResult::kOk);
        return id;
    }

    FenceState poll(FenceId id) {
        FenceState state = FenceState::kPending;
        EXPECT_EQ(mBroker->pollFence(id, &state), BrokerResult::kOk);
        return state;
    }

    std::vector<FenceId> completions() {
        mBroker->waitForPendingFenceNotifications();
        std::lock_guard<std::mutex> lock(mCompletionsMutex);
        return mCompletions;
    }

    NiceMock<MockBackend>* mNative = nullptr;
    NiceMock<MockBackendContext>* mLastContext = nullptr;
    std::mutex mCompletionsMutex;
    std::vector<FenceId> mCompletions;
    // Compositor end of the last cross-domain channel.
    android::base::ManagedDescriptor mChannelPeer;
    std::unique_ptr<Broker> mBroker;
};

TEST_F(BrokerTest, DestroyedResourcesAreNotFound) {
    ResourceId id = createDisplayResource();
    ResourceInfo info;
    ASSERT_EQ(mBroker->getResourceInfo(id, &info), BrokerResult::kOk);
    EXPECT_EQ(info.component, ComponentType::k2D);
    EXPECT_EQ(info.stride, kWidth * 4);
    EXPECT_EQ(info.size, uint64_t{kWidth} * 4 * kHeight);

    EXPECT_EQ(mBroker->destroyResource(id), BrokerResult::kOk);
    EXPECT_EQ(mBroker->getResourceInfo(id, &info), BrokerResult::kNotFound);
    EXPECT_EQ(mBroker->destroyResource(id), BrokerResult::kNotFound);
}

TEST_F(BrokerTest, ResourceIdsAreNeverReused) {
    std::vector<ResourceId> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(createDisplayResource());
    }
    for (ResourceId id : ids) {
        ASSERT_EQ(mBroker->destroyResource(id), BrokerResult::kOk);
    }
    ResourceId next = createDisplayResource();
    for (ResourceId id : ids) {
        EXPECT_GT(next, id);
    }
}

TEST_F(BrokerTest, UnsupportedFormatsCreateNothing) {
    ResourceCreateArgs args = displayArgs();
    args.format = kVirglFormatNV12;
    ResourceId id = kInvalidResourceId;
    EXPECT_EQ(mBroker->createResource(args, &id), BrokerResult::kUnsupported);
    EXPECT_EQ(id, kInvalidResourceId);

    args = displayArgs();
    args.width = 0;
    EXPECT_EQ(mBroker->createResource(args, &id), BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->createResource(displayArgs(42), &id), BrokerResult::kNotFound);
}

TEST_F(BrokerTest, ExportIsIdempotent) {
    ContextId ctx = createNativeContext();
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mBroker->createResource(displayArgs(ctx), &id), BrokerResult::kOk);

    EXPECT_CALL(*mNative, exportResource(id, _))
        .WillOnce(Invoke([](ResourceId, ExportedDescriptor* out) {
            int fds[2];
            if (pipe(fds) != 0) {
                return BrokerResult::kBackendFailure;
            }
            close(fds[1]);
            out->descriptor = android::base::ManagedDescriptor(fds[0]);
            out->handleType = kMemHandleTypeOpaqueFd;
            return BrokerResult::kOk;
        }));

    ExportedHandle first;
    ExportedHandle second;
    ASSERT_EQ(mBroker->exportResource(id, &first), BrokerResult::kOk);
    ASSERT_EQ(mBroker->exportResource(id, &second), BrokerResult::kOk);
    EXPECT_GE(first.osHandle, 0);
    EXPECT_EQ(first.osHandle, second.osHandle);
    EXPECT_EQ(second.handleType, kMemHandleTypeOpaqueFd);

    android::base::ManagedDescriptor duplicate;
    uint32_t handleType = 0;
    ASSERT_EQ(mBroker->exportResourceDuplicate(id, &duplicate, &handleType), BrokerResult::kOk);
    ASSERT_TRUE(duplicate.get().has_value());
    EXPECT_NE(*duplicate.get(), first.osHandle);
    EXPECT_EQ(handleType, kMemHandleTypeOpaqueFd);
}

TEST_F(BrokerTest, ExportFailuresPropagate) {
    ResourceId id = createDisplayResource();
    ExportedHandle handle;
    EXPECT_EQ(mBroker->exportResource(id, &handle), BrokerResult::kUnsupported);
    EXPECT_EQ(mBroker->exportResource(id + 100, &handle), BrokerResult::kNotFound);
}

TEST_F(BrokerTest, ScanoutBlocksDestroy) {
    ResourceId id = createDisplayResource();
    ScanoutInfo scanout{.scanoutId = 0,
                        .resourceId = id,
                        .width = kWidth,
                        .height = kHeight,
                        .stride = kWidth * 4};
    ASSERT_EQ(mBroker->setScanout(scanout), BrokerResult::kOk);
    EXPECT_EQ(mBroker->destroyResource(id), BrokerResult::kInUse);

    ASSERT_EQ(mBroker->setScanout(ScanoutInfo{.scanoutId = 0}), BrokerResult::kOk);
    EXPECT_EQ(mBroker->destroyResource(id), BrokerResult::kOk);
}

TEST_F(BrokerTest, MismatchedScanoutStrideLeavesStateUnchanged) {
    ResourceId first = createDisplayResource();
    ResourceId second = createDisplayResource();
    ASSERT_EQ(mBroker->setScanout(ScanoutInfo{.scanoutId = 0,
                                              .resourceId = first,
                                              .width = kWidth,
                                              .height = kHeight}),
              BrokerResult::kOk);

    EXPECT_EQ(mBroker->setScanout(ScanoutInfo{.scanoutId = 0,
                                              .resourceId = second,
                                              .width = kWidth,
                                              .height = kHeight,
                                              .stride = kWidth * 4 - 4}),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->setScanout(ScanoutInfo{.scanoutId = 0,
                                              .resourceId = second,
                                              .x = 1,
                                              .width = kWidth,
                                              .height = kHeight}),
              BrokerResult::kInvalidArgument);

    ScanoutInfo current;
    ASSERT_EQ(mBroker->getScanout(0, &current), BrokerResult::kOk);
    EXPECT_EQ(current.resourceId, first);
    EXPECT_EQ(current.stride, kWidth * 4);
    EXPECT_EQ(mBroker->destroyResource(second), BrokerResult::kOk);
    EXPECT_EQ(mBroker->destroyResource(first), BrokerResult::kInUse);
}

TEST_F(BrokerTest, ScanoutIndexIsBounded) {
    ResourceId id = createDisplayResource();
    EXPECT_EQ(mBroker->setScanout(ScanoutInfo{.scanoutId = 2, .resourceId = id}),
              BrokerResult::kOutOfRange);
    ScanoutInfo current;
    EXPECT_EQ(mBroker->getScanout(2, &current), BrokerResult::kOutOfRange);
    EXPECT_EQ(mBroker->setScanout(ScanoutInfo{.scanoutId = 1, .resourceId = id + 1000}),
              BrokerResult::kNotFound);
}

TEST_F(BrokerTest, BlobScanoutsMustFit) {
    std::vector<uint8_t> pages(kWidth * 4 * kHeight);
    ResourceId blob = kInvalidResourceId;
    ASSERT_EQ(mBroker->createBlob(BlobCreateArgs{.blobMem = kBlobMemGuest, .size = pages.size()},
                                  {iovec{pages.data(), pages.size()}}, &blob),
              BrokerResult::kOk);

    ScanoutInfo scanout{.scanoutId = 1,
                        .resourceId = blob,
                        .width = kWidth,
                        .height = kHeight,
                        .format = kVirglFormatB8G8R8X8Unorm,
                        .stride = kWidth * 4,
                        .offset = 4};
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kInvalidArgument);
    scanout.offset = 0;
    scanout.stride = 0;
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kInvalidArgument);
    scanout.stride = kWidth * 4;
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kOk);
}

TEST_F(BrokerTest, ScanoutFormatCannotChangePixelSize) {
    ResourceId id = createDisplayResource();
    ResourceInfo info;
    ASSERT_EQ(mBroker->getResourceInfo(id, &info), BrokerResult::kOk);
    ASSERT_EQ(info.stride, kWidth * 4);

    ScanoutInfo scanout{.scanoutId = 0,
                        .resourceId = id,
                        .width = kWidth,
                        .height = kHeight,
                        .format = kVirglFormatB5G6R5Unorm,
                        .stride = kWidth * 2};
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kInvalidArgument);
    scanout.stride = kWidth * 4;
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kInvalidArgument);

    ScanoutInfo current;
    ASSERT_EQ(mBroker->getScanout(0, &current), BrokerResult::kOk);
    EXPECT_EQ(current.resourceId, kInvalidResourceId);

    scanout.format = kVirglFormatB8G8R8A8Unorm;
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kOk);
    ASSERT_EQ(mBroker->getScanout(0, &current), BrokerResult::kOk);
    EXPECT_EQ(current.format, kVirglFormatB8G8R8A8Unorm);
    EXPECT_EQ(current.stride, kWidth * 4);
}

TEST_F(BrokerTest, BlobScanoutOriginCountsTowardsBounds) {
    std::vector<uint8_t> pages(kWidth * 4 * kHeight);
    ResourceId blob = kInvalidResourceId;
    ASSERT_EQ(mBroker->createBlob(BlobCreateArgs{.blobMem = kBlobMemGuest, .size = pages.size()},
                                  {iovec{pages.data(), pages.size()}}, &blob),
              BrokerResult::kOk);

    ScanoutInfo scanout{.scanoutId = 0,
                        .resourceId = blob,
                        .y = 1,
                        .width = kWidth,
                        .height = kHeight,
                        .format = kVirglFormatB8G8R8X8Unorm,
                        .stride = kWidth * 4};
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kInvalidArgument);
    scanout.y = 0;
    scanout.x = 1;
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kInvalidArgument);
    scanout.width = kWidth - 1;
    scanout.height = kHeight - 1;
    scanout.y = 1;
    EXPECT_EQ(mBroker->setScanout(scanout), BrokerResult::kOk);
}

TEST_F(BrokerTest, WideResourceStrideDoesNotWrap) {
    ContextId ctx = createNativeContext();
    ResourceCreateArgs args;
    args.ctxId = ctx;
    args.format = kVirglFormatB8G8R8A8Unorm;
    args.width = 0x20000000;
    args.height = 1;
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mBroker->createResource(args, &id), BrokerResult::kOk);
    ResourceInfo info;
    ASSERT_EQ(mBroker->getResourceInfo(id, &info), BrokerResult::kOk);
    EXPECT_EQ(info.stride, 0x80000000u);

    EXPECT_CALL(*mNative, createResource(_, _, _)).Times(0);
    args.width = 0x40000000;
    EXPECT_EQ(mBroker->createResource(args, &id), BrokerResult::kInvalidArgument);
}

TEST_F(BrokerTest, UnmapReleasesTheHostMapping) {
    ContextId ctx = createNativeContext();
    std::vector<uint8_t> hostPages(kWidth * 4 * kHeight);
    EXPECT_CALL(*mNative, createBlob(_, _, _, _))
        .WillRepeatedly(Invoke([&hostPages](ResourceId, const BlobCreateArgs& args,
                                            const IovecList&, BackendResource* out) {
            out->size = args.size;
            out->mapInfo = kMapCacheCached | kMapAccessRw;
            out->mapping = ResourceMapping{.hva = hostPages.data(), .size = hostPages.size()};
            return BrokerResult::kOk;
        }));
    const BlobCreateArgs args{.ctxId = ctx,
                              .blobMem = kBlobMemHost3d,
                              .blobFlags = kBlobFlagUseMappable,
                              .size = hostPages.size()};
    ResourceId blob = kInvalidResourceId;
    ASSERT_EQ(mBroker->createBlob(args, {}, &blob), BrokerResult::kOk);

    ResourceMapping mapping;
    ASSERT_EQ(mBroker->mapResource(blob, &mapping), BrokerResult::kOk);
    EXPECT_EQ(mapping.hva, hostPages.data());

    EXPECT_CALL(*mNative, unmapResource(blob))
        .WillOnce(Return(BrokerResult::kBackendFailure))
        .WillOnce(Return(BrokerResult::kOk));
    EXPECT_EQ(mBroker->unmapResource(blob), BrokerResult::kBackendFailure);
    EXPECT_EQ(mBroker->mapResource(blob, &mapping), BrokerResult::kOk);

    EXPECT_EQ(mBroker->unmapResource(blob), BrokerResult::kOk);
    EXPECT_EQ(mBroker->mapResource(blob, &mapping), BrokerResult::kUnsupported);
    uint32_t mapInfo = 0;
    EXPECT_EQ(mBroker->getMapInfo(blob, &mapInfo), BrokerResult::kUnsupported);
    EXPECT_EQ(mBroker->unmapResource(blob), BrokerResult::kUnsupported);
    EXPECT_EQ(mBroker->unmapResource(blob + 100), BrokerResult::kNotFound);

    ResourceId scannedOut = kInvalidResourceId;
    ASSERT_EQ(mBroker->createBlob(args, {}, &scannedOut), BrokerResult::kOk);
    ASSERT_EQ(mBroker->setScanout(ScanoutInfo{.scanoutId = 0,
                                              .resourceId = scannedOut,
                                              .width = kWidth,
                                              .height = kHeight,
                                              .format = kVirglFormatB8G8R8X8Unorm,
                                              .stride = kWidth * 4}),
              BrokerResult::kOk);
    EXPECT_CALL(*mNative, unmapResource(scannedOut)).Times(0);
    EXPECT_EQ(mBroker->unmapResource(scannedOut), BrokerResult::kInUse);
}

TEST_F(BrokerTest, ContextFencesExportThroughTheirBackend) {
    ContextId ctx = createNativeContext();
    Fence fence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{}, 1, &fence), BrokerResult::kOk);

    EXPECT_CALL(*mNative, exportFence(ctx, 1, fence.id, _))
        .WillOnce(Invoke([](ContextId, uint8_t, FenceId, ExportedDescriptor* out) {
            int fds[2];
            if (pipe(fds) != 0) {
                return BrokerResult::kBackendFailure;
            }
            close(fds[1]);
            out->descriptor = android::base::ManagedDescriptor(fds[0]);
            out->handleType = kFenceHandleTypeSyncFd;
            return BrokerResult::kOk;
        }));
    android::base::ManagedDescriptor descriptor;
    uint32_t handleType = 0;
    ASSERT_EQ(mBroker->exportFence(fence.id, &descriptor, &handleType), BrokerResult::kOk);
    EXPECT_TRUE(descriptor.get().has_value());
    EXPECT_EQ(handleType, kFenceHandleTypeSyncFd);

    Fence global = mBroker->createGlobalFence();
    EXPECT_EQ(mBroker->exportFence(global.id, &descriptor, &handleType),
              BrokerResult::kUnsupported);
    EXPECT_EQ(mBroker->exportFence(global.id + 100, &descriptor, &handleType),
              BrokerResult::kNotFound);
}

TEST_F(BrokerTest, SubmitFencesIncreaseAndRetireInOrder) {
    ContextId ctx = createNativeContext();
    const uint8_t commands[] = {0};
    Fence fences[3];
    for (Fence& fence : fences) {
        ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{commands, sizeof(commands)}, 0, &fence),
                  BrokerResult::kOk);
    }
    EXPECT_LT(fences[0].id, fences[1].id);
    EXPECT_LT(fences[1].id, fences[2].id);

    ASSERT_EQ(mBroker->signalFence(fences[2].ring, fences[2].id), BrokerResult::kOk);
    EXPECT_EQ(poll(fences[2].id), FenceState::kPending);

    ASSERT_EQ(mBroker->signalFence(fences[0].ring, fences[0].id), BrokerResult::kOk);
    ASSERT_EQ(mBroker->signalFence(fences[1].ring, fences[1].id), BrokerResult::kOk);
    EXPECT_EQ(poll(fences[2].id), FenceState::kSignaled);
    EXPECT_THAT(completions(),
                ::testing::ElementsAre(fences[0].id, fences[1].id, fences[2].id));
}

TEST_F(BrokerTest, DuplicateSignalsAreNoOps) {
    ContextId ctx = createNativeContext();
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mBroker->createResource(displayArgs(ctx), &id), BrokerResult::kOk);
    ASSERT_EQ(mBroker->attachResource(ctx, id), BrokerResult::kOk);

    Fence fence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{}, 0, &fence), BrokerResult::kOk);
    EXPECT_EQ(mBroker->signalFence(fence.ring, fence.id), BrokerResult::kOk);
    EXPECT_EQ(poll(fence.id), FenceState::kSignaled);
    EXPECT_EQ(mBroker->signalFence(fence.ring, fence.id), BrokerResult::kOk);
    EXPECT_EQ(poll(fence.id), FenceState::kSignaled);
    EXPECT_EQ(completions().size(), 1u);
}

TEST_F(BrokerTest, ForeignSignalsAreInvariantViolations) {
    ContextId ctx = createNativeContext();
    Fence fence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{}, 0, &fence), BrokerResult::kOk);
    EXPECT_EQ(mBroker->signalFence(FenceRingContextSpecific{ctx + 1, 0}, fence.id),
              BrokerResult::kInvariantViolation);
    EXPECT_EQ(mBroker->signalFence(fence.ring, fence.id + 50),
              BrokerResult::kInvariantViolation);
    EXPECT_EQ(poll(fence.id), FenceState::kPending);
}

TEST_F(BrokerTest, PendingFencesBlockDestroy) {
    ContextId ctx = createNativeContext();
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mBroker->createResource(displayArgs(ctx), &id), BrokerResult::kOk);
    ASSERT_EQ(mBroker->attachResource(ctx, id), BrokerResult::kOk);

    Fence fence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{}, 0, &fence), BrokerResult::kOk);
    EXPECT_EQ(mBroker->destroyResource(id), BrokerResult::kInUse);
    ASSERT_EQ(mBroker->signalFence(fence.ring, fence.id), BrokerResult::kOk);
    EXPECT_CALL(*mNative, destroyResource(id)).Times(1);
    EXPECT_EQ(mBroker->destroyResource(id), BrokerResult::kOk);
}

TEST_F(BrokerTest, FailedSubmitsDropTheirFence) {
    ContextId ctx = createNativeContext();
    EXPECT_CALL(*mLastContext, submit(_, _, _)).WillOnce(Return(BrokerResult::kBackendFailure));
    Fence fence;
    EXPECT_EQ(mBroker->submit(ctx, CommandBuffer{}, 0, &fence), BrokerResult::kBackendFailure);
    EXPECT_TRUE(completions().empty());
}

TEST_F(BrokerTest, StubContextsAreSignaledImmediately) {
    ContextId ctx = kNoContext;
    ASSERT_EQ(mBroker->createContext(kCapsetMagma, 0, ComponentType::kStub, "", &ctx),
              BrokerResult::kOk);
    Fence fence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{}, 0, &fence), BrokerResult::kOk);
    EXPECT_EQ(poll(fence.id), FenceState::kSignaled);
    EXPECT_EQ(mBroker->destroyContext(ctx), BrokerResult::kOk);
}

TEST_F(BrokerTest, DestroyingABusyContextNeedsAbandon) {
    ContextId ctx = createNativeContext();
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mBroker->createResource(displayArgs(ctx), &id), BrokerResult::kOk);
    ASSERT_EQ(mBroker->attachResource(ctx, id), BrokerResult::kOk);
    Fence fence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{}, 0, &fence), BrokerResult::kOk);

    EXPECT_EQ(mBroker->destroyContext(ctx), BrokerResult::kInUse);
    EXPECT_EQ(mBroker->destroyContext(ctx, ContextDestroyMode::kAbandonPending),
              BrokerResult::kOk);
    EXPECT_EQ(poll(fence.id), FenceState::kSignaled);
    EXPECT_EQ(mBroker->signalFence(fence.ring, fence.id), BrokerResult::kOk);

    ResourceInfo info;
    ASSERT_EQ(mBroker->getResourceInfo(id, &info), BrokerResult::kOk);
    EXPECT_TRUE(info.attachedContexts.empty());
    EXPECT_EQ(mBroker->destroyResource(id), BrokerResult::kOk);
    EXPECT_EQ(mBroker->destroyContext(ctx), BrokerResult::kNotFound);
}

TEST_F(BrokerTest, ResourcesAreExclusiveUnlessShareable) {
    ContextId first = createNativeContext();
    ContextId second = createNativeContext();
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mBroker->createResource(displayArgs(first), &id), BrokerResult::kOk);
    ASSERT_EQ(mBroker->attachResource(first, id), BrokerResult::kOk);
    EXPECT_EQ(mBroker->attachResource(first, id), BrokerResult::kOk);
    EXPECT_EQ(mBroker->attachResource(second, id), BrokerResult::kInUse);

    EXPECT_EQ(mBroker->detachResource(first, id), BrokerResult::kOk);
    EXPECT_EQ(mBroker->detachResource(first, id), BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->attachResource(second, id), BrokerResult::kOk);

    ResourceId shared = kInvalidResourceId;
    ASSERT_EQ(mBroker->createBlob(BlobCreateArgs{.ctxId = first,
                                                 .blobMem = kBlobMemHost3d,
                                                 .blobFlags = kBlobFlagUseShareable,
                                                 .size = 4096},
                                  {}, &shared),
              BrokerResult::kOk);
    EXPECT_EQ(mBroker->attachResource(first, shared), BrokerResult::kOk);
    EXPECT_EQ(mBroker->attachResource(second, shared), BrokerResult::kOk);
}

TEST_F(BrokerTest, GuestBlobsNeedEnoughBacking) {
    std::vector<uint8_t> pages(100);
    ResourceId id = kInvalidResourceId;
    EXPECT_EQ(mBroker->createBlob(BlobCreateArgs{.blobMem = kBlobMemGuest, .size = 4096},
                                  {iovec{pages.data(), pages.size()}}, &id),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->createBlob(BlobCreateArgs{.blobMem = 9, .size = 4096}, {}, &id),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->createBlob(BlobCreateArgs{.blobMem = kBlobMemGuest, .size = 0}, {}, &id),
              BrokerResult::kInvalidArgument);
}

TEST_F(BrokerTest, TransfersCopyGuestPixels) {
    ResourceId id = createDisplayResource();
    std::vector<uint8_t> guest(kWidth * 4 * kHeight);
    for (size_t i = 0; i < guest.size(); ++i) {
        guest[i] = static_cast<uint8_t>(i);
    }

    Fence fence;
    TransferBox box{.w = kWidth, .h = kHeight};
    EXPECT_EQ(mBroker->transferToHost(kNoContext, id, box, &fence),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->detachBacking(id), BrokerResult::kInvalidArgument);

    ASSERT_EQ(mBroker->attachBacking(id, {iovec{guest.data(), guest.size()}}),
              BrokerResult::kOk);
    ASSERT_EQ(mBroker->transferToHost(kNoContext, id, box, &fence), BrokerResult::kOk);
    EXPECT_TRUE(std::holds_alternative<FenceRingGlobal>(fence.ring));
    EXPECT_EQ(poll(fence.id), FenceState::kSignaled);

    std::vector<uint8_t> readBack(guest.size());
    IovecList dst = {iovec{readBack.data(), readBack.size()}};
    ASSERT_EQ(mBroker->transferFromHost(kNoContext, id, box, &dst, &fence), BrokerResult::kOk);
    EXPECT_EQ(readBack, guest);

    EXPECT_EQ(mBroker->detachBacking(id), BrokerResult::kOk);
    EXPECT_EQ(mBroker->transferToHost(kNoContext, id + 100, box, &fence),
              BrokerResult::kNotFound);
}

TEST_F(BrokerTest, TransfersOutsideTheResourceNeverReachTheBackend) {
    ContextId ctx = createNativeContext();
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mBroker->createResource(displayArgs(ctx), &id), BrokerResult::kOk);
    std::vector<uint8_t> guest(kWidth * 4 * (kHeight / 2));
    ASSERT_EQ(mBroker->attachBacking(id, {iovec{guest.data(), guest.size()}}),
              BrokerResult::kOk);

    EXPECT_CALL(*mNative, transferToHost(ctx, id, _)).Times(1);
    Fence fence;
    EXPECT_EQ(mBroker->transferToHost(ctx, id, TransferBox{.w = kWidth, .h = kHeight}, &fence),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->transferToHost(ctx, id, TransferBox{.x = 1, .w = kWidth, .h = 1}, &fence),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(mBroker->transferToHost(
                  ctx, id, TransferBox{.w = kWidth, .h = 1, .offset = guest.size()}, &fence),
              BrokerResult::kInvalidArgument);

    ASSERT_EQ(
        mBroker->transferToHost(ctx, id, TransferBox{.w = kWidth, .h = kHeight / 2}, &fence),
        BrokerResult::kOk);
    EXPECT_EQ(poll(fence.id), FenceState::kSignaled);
}

TEST_F(BrokerTest, GlobalFencesFollowEarlierWork) {
    Fence first = mBroker->createGlobalFence();
    Fence second = mBroker->createGlobalFence();
    EXPECT_LT(first.id, second.id);
    FenceState state = FenceState::kPending;
    EXPECT_EQ(mBroker->waitFence(second.id, 1000, &state), BrokerResult::kOk);
    EXPECT_EQ(state, FenceState::kSignaled);

    mBroker->markFencesObserved(second.id);
    EXPECT_EQ(poll(first.id), FenceState::kSignaled);
    EXPECT_EQ(mBroker->pollFence(second.id + 10, &state), BrokerResult::kNotFound);
}

TEST_F(BrokerTest, CapsetQueries) {
    EXPECT_EQ(mBroker->getCapsetCount(), 3u);
    CapsetInfo info;
    ASSERT_EQ(mBroker->getCapsetInfo(0, &info), BrokerResult::kOk);
    EXPECT_EQ(info.id, kCapsetGfxstreamVulkan);
    EXPECT_EQ(info.maxVersion, 1u);
    EXPECT_EQ(info.maxSize, 4u);
    ASSERT_EQ(mBroker->getCapsetInfo(1, &info), BrokerResult::kOk);
    EXPECT_EQ(info.id, kCapsetCrossDomain);
    ASSERT_EQ(mBroker->getCapsetInfo(2, &info), BrokerResult::kOk);
    EXPECT_EQ(info.id, kCapsetMagma);
    EXPECT_EQ(mBroker->getCapsetInfo(3, &info), BrokerResult::kOutOfRange);

    std::vector<uint8_t> data;
    ASSERT_EQ(mBroker->getCapset(kCapsetGfxstreamVulkan, 1, &data), BrokerResult::kOk);
    EXPECT_EQ(data, std::vector<uint8_t>({1, 2, 3, 4}));
    EXPECT_EQ(mBroker->getCapset(kCapsetGfxstreamVulkan, 2, &data), BrokerResult::kUnsupported);
    EXPECT_EQ(mBroker->getCapset(kCapsetVenus, 0, &data), BrokerResult::kNotFound);
}

TEST_F(BrokerTest, UnregisteredCapsetCreatesNoContext) {
    const uint32_t countBefore = mBroker->getCapsetCount();
    ContextId ctx = kNoContext;
    EXPECT_EQ(mBroker->createContext(kCapsetVirgl2, 0, std::nullopt, "", &ctx),
              BrokerResult::kUnsupported);
    EXPECT_EQ(ctx, kNoContext);
    EXPECT_EQ(mBroker->getCapsetCount(), countBefore);

    ContextId next = createNativeContext();
    EXPECT_EQ(next, 1u);
}

TEST_F(BrokerTest, CrossDomainImageBlobs) {
    ContextId ctx = kNoContext;
    ASSERT_EQ(mBroker->createContext(kCapsetCrossDomain, 1, std::nullopt, "wayland", &ctx),
              BrokerResult::kOk);

    std::vector<uint8_t> ringPages(4096);
    ResourceId ring = kInvalidResourceId;
    ASSERT_EQ(mBroker->createBlob(BlobCreateArgs{.ctxId = ctx,
                                                 .blobMem = kBlobMemGuest,
                                                 .size = ringPages.size()},
                                  {iovec{ringPages.data(), ringPages.size()}}, &ring),
              BrokerResult::kOk);
    ASSERT_EQ(mBroker->attachResource(ctx, ring), BrokerResult::kOk);

    CrossDomainInit init;
    memset(&init, 0, sizeof(init));
    init.hdr.cmd = kCrossDomainCmdInit;
    init.hdr.cmd_size = sizeof(init);
    init.query_ring_id = ring;
    init.channel_ring_id = ring;
    init.channel_type = kCrossDomainChannelTypeWayland;
    Fence fence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{reinterpret_cast<uint8_t*>(&init), sizeof(init)},
                              kCrossDomainQueryRing, &fence),
              BrokerResult::kOk);
    EXPECT_EQ(poll(fence.id), FenceState::kSignaled);

    CrossDomainGetImageRequirements request;
    memset(&request, 0, sizeof(request));
    request.hdr.cmd = kCrossDomainCmdGetImageRequirements;
    request.hdr.cmd_size = sizeof(request);
    request.width = 256;
    request.height = 256;
    request.drm_format = kDrmFormatXrgb8888;
    ASSERT_EQ(mBroker->submit(ctx,
                              CommandBuffer{reinterpret_cast<uint8_t*>(&request), sizeof(request)},
                              kCrossDomainQueryRing, &fence),
              BrokerResult::kOk);

    CrossDomainImageRequirements reqs;
    memcpy(&reqs, ringPages.data(), sizeof(reqs));
    EXPECT_EQ(reqs.strides[0], 1024u);
    EXPECT_EQ(reqs.size, 256u * 1024u);

    ResourceId image = kInvalidResourceId;
    ASSERT_EQ(mBroker->createBlob(BlobCreateArgs{.ctxId = ctx,
                                                 .blobMem = kBlobMemHost3d,
                                                 .blobFlags = kBlobFlagUseMappable |
                                                              kBlobFlagUseShareable,
                                                 .blobId = reqs.blob_id,
                                                 .size = reqs.size},
                                  {}, &image),
              BrokerResult::kOk);

    ResourceMapping mapping;
    ASSERT_EQ(mBroker->mapResource(image, &mapping), BrokerResult::kOk);
    ASSERT_NE(mapping.hva, nullptr);
    EXPECT_EQ(mapping.size, reqs.size);
    uint32_t mapInfo = 0;
    ASSERT_EQ(mBroker->getMapInfo(image, &mapInfo), BrokerResult::kOk);
    EXPECT_EQ(mapInfo & kMapCacheMask, kMapCacheCached);

    ExportedHandle first;
    ExportedHandle second;
    ASSERT_EQ(mBroker->exportResource(image, &first), BrokerResult::kOk);
    ASSERT_EQ(mBroker->exportResource(image, &second), BrokerResult::kOk);
    EXPECT_EQ(first.handleType, kMemHandleTypeShm);
    EXPECT_EQ(first.osHandle, second.osHandle);

    EXPECT_EQ(mBroker->mapResource(ring, &mapping), BrokerResult::kUnsupported);

    // Share the image with the compositor and wait for its answer on the channel ring.
    ASSERT_EQ(mBroker->attachResource(ctx, image), BrokerResult::kOk);
    CrossDomainSendReceive send;
    memset(&send, 0, sizeof(send));
    send.hdr.cmd = kCrossDomainCmdSend;
    send.hdr.cmd_size = sizeof(send) + 3;
    send.num_identifiers = 1;
    send.opaque_data_size = 3;
    send.identifiers[0] = image;
    send.identifier_types[0] = kCrossDomainIdTypeVirtgpuBlob;
    std::vector<uint8_t> sendBytes(sizeof(send) + 3);
    memcpy(sendBytes.data(), &send, sizeof(send));
    memcpy(sendBytes.data() + sizeof(send), "img", 3);
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{sendBytes.data(), sendBytes.size()},
                              kCrossDomainQueryRing, &fence),
              BrokerResult::kOk);

    ASSERT_TRUE(mChannelPeer.get().has_value());
    char data[8];
    iovec iov{data, sizeof(data)};
    alignas(cmsghdr) char control[CMSG_SPACE(sizeof(int))];
    msghdr msg;
    memset(&msg, 0, sizeof(msg));
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);
    ASSERT_EQ(recvmsg(*mChannelPeer.get(), &msg, MSG_CMSG_CLOEXEC), 3);
    cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
    ASSERT_NE(cmsg, nullptr);
    ASSERT_EQ(cmsg->cmsg_type, SCM_RIGHTS);
    int shared;
    memcpy(&shared, CMSG_DATA(cmsg), sizeof(shared));
    android::base::ManagedDescriptor sharedImage(shared);
    EXPECT_EQ(lseek(shared, 0, SEEK_END), static_cast<off_t>(reqs.size));

    Fence channelFence;
    ASSERT_EQ(mBroker->submit(ctx, CommandBuffer{}, kCrossDomainChannelRing, &channelFence),
              BrokerResult::kOk);
    EXPECT_EQ(poll(channelFence.id), FenceState::kPending);
    ASSERT_EQ(write(*mChannelPeer.get(), "ok", 2), 2);
    FenceState state = FenceState::kPending;
    ASSERT_EQ(mBroker->waitFence(channelFence.id, 5000000, &state), BrokerResult::kOk);
    EXPECT_EQ(state, FenceState::kSignaled);

    CrossDomainSendReceive receive;
    memcpy(&receive, ringPages.data(), sizeof(receive));
    EXPECT_EQ(receive.hdr.cmd, kCrossDomainCmdReceive);
    EXPECT_EQ(receive.opaque_data_size, 2u);
    EXPECT_EQ(memcmp(ringPages.data() + sizeof(receive), "ok", 2), 0);

    EXPECT_EQ(mBroker->destroyResource(image), BrokerResult::kOk);
}

TEST(BrokerBuilderTest, RejectsDuplicateComponents) {
    BrokerBuilder builder;
    builder.addBackend(std::make_unique<SoftwareBackend>())
        .addBackend(std::make_unique<SoftwareBackend>());
    std::unique_ptr<Broker> broker;
    EXPECT_EQ(builder.build(&broker), BrokerResult::kInvalidArgument);
    EXPECT_EQ(broker, nullptr);
}

TEST(BrokerBuilderTest, RejectsClashingCapsets) {
    BrokerBuilder builder;
    builder.addBackend(std::make_unique<SoftwareBackend>())
        .addBackend(std::make_unique<StubBackend>())
        .addBackend(makeMockBackend(ComponentType::kNativeRender,
                                    {CapsetDescriptor{.id = kCapsetMagma}}));
    std::unique_ptr<Broker> broker;
    EXPECT_EQ(builder.build(&broker), BrokerResult::kInvalidArgument);
}

TEST(BrokerBuilderTest, RejectsBadScanoutCounts) {
    BrokerConfig config;
    config.numScanouts = kMaxScanouts + 1;
    BrokerBuilder builder(config);
    builder.addBackend(std::make_unique<SoftwareBackend>());
    std::unique_ptr<Broker> broker;
    EXPECT_EQ(builder.build(&broker), BrokerResult::kInvalidArgument);
}

TEST(BrokerBuilderTest, PropagatesBackendInitFailure) {
    auto native = makeMockBackend(ComponentType::kNativeRender, {});
    EXPECT_CALL(*native, initialize(_)).WillOnce(Return(BrokerResult::kBackendFailure));
    BrokerBuilder builder;
    builder.addBackend(std::make_unique<SoftwareBackend>()).addBackend(std::move(native));
    std::unique_ptr<Broker> broker;
    EXPECT_EQ(builder.build(&broker), BrokerResult::kBackendFailure);
    EXPECT_EQ(broker, nullptr);
}

TEST(BrokerBuilderTest, CapsetMaskHidesCapsets) {
    auto native = makeMockBackend(ComponentType::kNativeRender,
                                  {CapsetDescriptor{.id = kCapsetVirgl},
                                   CapsetDescriptor{.id = kCapsetVirgl2},
                                   CapsetDescriptor{.id = kCapsetGfxstreamVulkan}});
    BrokerConfig config;
    config.defaultComponent = ComponentType::kNativeRender;
    config.capsetMask = CapsetRegistry::maskBit(kCapsetVirgl) |
                        CapsetRegistry::maskBit(kCapsetGfxstreamVulkan);
    BrokerBuilder builder(config);
    builder.addBackend(std::move(native));
    std::unique_ptr<Broker> broker;
    ASSERT_EQ(builder.build(&broker), BrokerResult::kOk);

    EXPECT_EQ(broker->getCapsetCount(), 2u);
    CapsetInfo info;
    ASSERT_EQ(broker->getCapsetInfo(0, &info), BrokerResult::kOk);
    EXPECT_EQ(info.id, kCapsetVirgl);
    ASSERT_EQ(broker->getCapsetInfo(1, &info), BrokerResult::kOk);
    EXPECT_EQ(info.id, kCapsetGfxstreamVulkan);
    EXPECT_EQ(broker->getCapsetInfo(2, &info), BrokerResult::kOutOfRange);

    ContextId ctx = kNoContext;
    EXPECT_EQ(broker->createContext(kCapsetVirgl2, 0, std::nullopt, "", &ctx),
              BrokerResult::kUnsupported);
}

TEST(BrokerBuilderDeathTest, MissingDefaultBackendAborts) {
    EXPECT_DEATH(
        {
            BrokerBuilder builder;
            builder.addBackend(std::make_unique<StubBackend>());
            std::unique_ptr<Broker> broker;
            BrokerResult result = builder.build(&broker);
            (void)result;
        },
        R"re(default component 2d has no backend)re");
}

TEST(BrokerBuilderDeathTest, BuildingTwiceAborts) {
    EXPECT_DEATH(
        {
            BrokerBuilder builder;
            builder.addBackend(std::make_unique<SoftwareBackend>());
            std::unique_ptr<Broker> first;
            std::unique_ptr<Broker> second;
            if (builder.build(&first) == BrokerResult::kOk) {
                BrokerResult result = builder.build(&second);
                (void)result;
            }
        },
        R"re(can only build one broker)re");
}

}  // namespace
}  // namespace gfxbroker
