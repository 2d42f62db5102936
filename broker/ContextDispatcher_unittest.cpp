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

#include "ContextDispatcher.h"
#include "contexts/StubBackend.h"
#include "tests/MockBackend.h"

namespace gfxbroker {
namespace {

using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class ContextDispatcherTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto backend = makeMockBackend(ComponentType::kNativeRender,
                                       {CapsetDescriptor{.id = kCapsetGfxstreamVulkan,
                                                         .version = 2}});
        mBackend = backend.get();
        ASSERT_EQ(mRegistry.registerCapset(CapsetDescriptor{.id = kCapsetGfxstreamVulkan,
                                                            .version = 2},
                                           ComponentType::kNativeRender),
                  BrokerResult::kOk);
        ASSERT_EQ(mRegistry.registerCapset(CapsetDescriptor{.id = kCapsetMagma},
                                           ComponentType::kStub),
                  BrokerResult::kOk);
        mRegistry.freeze();

        mDispatcher = std::make_unique<ContextDispatcher>(
            &mRegistry, CapsetRegistry::kAllCapsets & ~CapsetRegistry::maskBit(kCapsetVenus));
        ASSERT_EQ(mDispatcher->addBackend(std::move(backend)), BrokerResult::kOk);
        ASSERT_EQ(mDispatcher->addBackend(std::make_unique<StubBackend>()), BrokerResult::kOk);

        ON_CALL(*mBackend, createContext(_, _, _, _))
            .WillByDefault(Invoke([this](ContextId, uint32_t, const std::string&,
                                         std::unique_ptr<BackendContext>* out) {
                auto context = std::make_unique<NiceMock<MockBackendContext>>();
                mLastContext = context.get();
                *out = std::move(context);
                return BrokerResult::kOk;
            }));
    }

    CapsetRegistry mRegistry;
    NiceMock<MockBackend>* mBackend = nullptr;
    NiceMock<MockBackendContext>* mLastContext = nullptr;
    std::unique_ptr<ContextDispatcher> mDispatcher;
};

TEST_F(ContextDispatcherTest, RoutesByCapset) {
    ContextId vk = kNoContext;
    ContextId stub = kNoContext;
    ASSERT_EQ(mDispatcher->createContext(kCapsetGfxstreamVulkan, 1, std::nullopt, "vk", &vk),
              BrokerResult::kOk);
    ASSERT_EQ(mDispatcher->createContext(kCapsetMagma, 0, ComponentType::kStub, "stub", &stub),
              BrokerResult::kOk);
    EXPECT_EQ(vk, 1u);
    EXPECT_EQ(stub, 2u);

    ContextInfo info;
    ASSERT_EQ(mDispatcher->getContextInfo(vk, &info), BrokerResult::kOk);
    EXPECT_EQ(info.component, ComponentType::kNativeRender);
    EXPECT_EQ(info.capsetId, kCapsetGfxstreamVulkan);
    EXPECT_EQ(info.capsetVersion, 1u);
    EXPECT_EQ(info.name, "vk");
    ASSERT_EQ(mDispatcher->getContextInfo(stub, &info), BrokerResult::kOk);
    EXPECT_EQ(info.component, ComponentType::kStub);
}

TEST_F(ContextDispatcherTest, FailedCreationsDoNotConsumeIds) {
    ContextId ctx = kNoContext;
    EXPECT_EQ(mDispatcher->createContext(kCapsetVirgl2, 0, std::nullopt, "", &ctx),
              BrokerResult::kUnsupported);
    EXPECT_EQ(mDispatcher->createContext(kCapsetGfxstreamVulkan, 3, std::nullopt, "", &ctx),
              BrokerResult::kUnsupported);
    EXPECT_EQ(mDispatcher->createContext(kCapsetGfxstreamVulkan, 2, ComponentType::kCrossDomain,
                                         "", &ctx),
              BrokerResult::kUnsupported);

    EXPECT_CALL(*mBackend, createContext(_, _, _, _))
        .WillOnce(Return(BrokerResult::kBackendFailure));
    EXPECT_EQ(mDispatcher->createContext(kCapsetGfxstreamVulkan, 2, std::nullopt, "", &ctx),
              BrokerResult::kBackendFailure);
    EXPECT_EQ(ctx, kNoContext);

    ASSERT_EQ(mDispatcher->createContext(kCapsetMagma, 0, std::nullopt, "", &ctx),
              BrokerResult::kOk);
    EXPECT_EQ(ctx, 1u);
}

TEST(ContextDispatcherMaskTest, MaskedCapsetsAreUnsupported) {
    CapsetRegistry registry;
    ASSERT_EQ(registry.registerCapset(CapsetDescriptor{.id = kCapsetMagma}, ComponentType::kStub),
              BrokerResult::kOk);
    registry.freeze();
    ContextDispatcher dispatcher(&registry, CapsetRegistry::maskBit(kCapsetCrossDomain));
    ASSERT_EQ(dispatcher.addBackend(std::make_unique<StubBackend>()), BrokerResult::kOk);

    ContextId ctx = kNoContext;
    EXPECT_EQ(dispatcher.createContext(kCapsetMagma, 0, std::nullopt, "", &ctx),
              BrokerResult::kUnsupported);
    EXPECT_FALSE(dispatcher.contains(1));
}

TEST_F(ContextDispatcherTest, DuplicateBackendsAreRejected) {
    EXPECT_EQ(mDispatcher->addBackend(std::make_unique<StubBackend>()),
              BrokerResult::kAlreadyExists);
    EXPECT_EQ(mDispatcher->backendFor(ComponentType::kNativeRender), mBackend);
    EXPECT_EQ(mDispatcher->backendFor(ComponentType::kCrossDomain), nullptr);
    EXPECT_EQ(mDispatcher->backends().size(), 2u);
}

TEST_F(ContextDispatcherTest, RequestsReachTheOwningContext) {
    ContextId ctx = kNoContext;
    ASSERT_EQ(mDispatcher->createContext(kCapsetGfxstreamVulkan, 2, std::nullopt, "", &ctx),
              BrokerResult::kOk);
    ASSERT_NE(mLastContext, nullptr);

    const Fence fence{.id = 5, .ring = FenceRingContextSpecific{ctx, 0}};
    EXPECT_CALL(*mLastContext, submit(_, _, _))
        .WillOnce(DoAll(Invoke([](const CommandBuffer&, const Fence& f, base::AsyncResult* r) {
                            EXPECT_EQ(f.id, 5u);
                            *r = base::AsyncResult::OK_AND_CALLBACK_SCHEDULED;
                        }),
                        Return(BrokerResult::kOk)));
    EXPECT_CALL(*mLastContext, attachResource(_)).WillOnce(Return(BrokerResult::kOk));
    EXPECT_CALL(*mLastContext, detachResource(9)).Times(1);
    EXPECT_CALL(*mLastContext, createBlob(12, _, _)).WillOnce(Return(BrokerResult::kOk));

    base::AsyncResult result;
    EXPECT_EQ(mDispatcher->submit(ctx, CommandBuffer{}, fence, &result), BrokerResult::kOk);
    EXPECT_EQ(result.Value(), base::AsyncResult::OK_AND_CALLBACK_SCHEDULED);
    EXPECT_EQ(mDispatcher->attachResource(ctx, ContextResource{.id = 9}), BrokerResult::kOk);
    EXPECT_EQ(mDispatcher->detachResource(ctx, 9), BrokerResult::kOk);
    BackendResource blob;
    EXPECT_EQ(mDispatcher->createContextBlob(ctx, 12, BlobCreateArgs{}, &blob),
              BrokerResult::kOk);
}

TEST_F(ContextDispatcherTest, UnknownContextsAreNotFound) {
    base::AsyncResult result;
    EXPECT_EQ(mDispatcher->submit(3, CommandBuffer{}, Fence{}, &result), BrokerResult::kNotFound);
    EXPECT_EQ(mDispatcher->attachResource(3, ContextResource{}), BrokerResult::kNotFound);
    EXPECT_EQ(mDispatcher->detachResource(3, 1), BrokerResult::kNotFound);
    EXPECT_EQ(mDispatcher->destroyContext(3), BrokerResult::kNotFound);
}

TEST_F(ContextDispatcherTest, DestroyedContextsAreGone) {
    ContextId ctx = kNoContext;
    ASSERT_EQ(mDispatcher->createContext(kCapsetMagma, 0, std::nullopt, "", &ctx),
              BrokerResult::kOk);
    EXPECT_TRUE(mDispatcher->contains(ctx));
    EXPECT_EQ(mDispatcher->destroyContext(ctx), BrokerResult::kOk);
    EXPECT_FALSE(mDispatcher->contains(ctx));

    ContextId next = kNoContext;
    ASSERT_EQ(mDispatcher->createContext(kCapsetMagma, 0, std::nullopt, "", &next),
              BrokerResult::kOk);
    EXPECT_GT(next, ctx);
}

}  // namespace
}  // namespace gfxbroker
