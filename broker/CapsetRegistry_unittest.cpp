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

#include "CapsetRegistry.h"

namespace gfxbroker {
namespace {

using ::testing::ElementsAre;

CapsetDescriptor makeCapset(uint32_t id, uint32_t version, std::vector<uint8_t> data = {}) {
    return CapsetDescriptor{.id = id, .version = version, .data = std::move(data)};
}

class CapsetRegistryTest : public ::testing::Test {
   protected:
    void SetUp() override {
        ASSERT_EQ(mRegistry.registerCapset(makeCapset(1, 2, {0xa}), ComponentType::kNativeRender),
                  BrokerResult::kOk);
        ASSERT_EQ(mRegistry.registerCapset(makeCapset(2, 1, {0xb, 0xb}),
                                           ComponentType::kNativeRender),
                  BrokerResult::kOk);
        ASSERT_EQ(mRegistry.registerCapset(makeCapset(3, 1, {0xc, 0xc, 0xc}),
                                           ComponentType::kCrossDomain),
                  BrokerResult::kOk);
        mRegistry.freeze();
    }

    CapsetRegistry mRegistry;
};

TEST_F(CapsetRegistryTest, CountRespectsMask) {
    EXPECT_EQ(mRegistry.count(CapsetRegistry::kAllCapsets), 3u);
    EXPECT_EQ(mRegistry.count(CapsetRegistry::maskBit(1) | CapsetRegistry::maskBit(3)), 2u);
    EXPECT_EQ(mRegistry.count(0), 0u);
}

TEST_F(CapsetRegistryTest, GetEnumeratesVisibleCapsetsInRegistrationOrder) {
    const uint64_t mask = CapsetRegistry::maskBit(1) | CapsetRegistry::maskBit(3);
    CapsetDescriptor capset;

    ASSERT_EQ(mRegistry.get(0, mask, &capset), BrokerResult::kOk);
    EXPECT_EQ(capset.id, 1u);
    EXPECT_THAT(capset.data, ElementsAre(0xa));

    ASSERT_EQ(mRegistry.get(1, mask, &capset), BrokerResult::kOk);
    EXPECT_EQ(capset.id, 3u);
    EXPECT_THAT(capset.data, ElementsAre(0xc, 0xc, 0xc));

    EXPECT_EQ(mRegistry.get(2, mask, &capset), BrokerResult::kOutOfRange);
}

TEST_F(CapsetRegistryTest, GetInfoReportsVersionAndSize) {
    CapsetInfo info;
    ASSERT_EQ(mRegistry.getInfo(1, CapsetRegistry::kAllCapsets, &info), BrokerResult::kOk);
    EXPECT_EQ(info.id, 2u);
    EXPECT_EQ(info.maxVersion, 1u);
    EXPECT_EQ(info.maxSize, 2u);
    EXPECT_EQ(mRegistry.getInfo(3, CapsetRegistry::kAllCapsets, &info),
              BrokerResult::kOutOfRange);
}

TEST_F(CapsetRegistryTest, FindHonorsMaskAndReportsComponent) {
    ComponentType component = ComponentType::k2D;
    EXPECT_EQ(mRegistry.find(3, CapsetRegistry::kAllCapsets, nullptr, &component),
              BrokerResult::kOk);
    EXPECT_EQ(component, ComponentType::kCrossDomain);

    EXPECT_EQ(mRegistry.find(3, CapsetRegistry::maskBit(1), nullptr, nullptr),
              BrokerResult::kNotFound);
    EXPECT_EQ(mRegistry.find(9, CapsetRegistry::kAllCapsets, nullptr, nullptr),
              BrokerResult::kNotFound);
}

TEST(CapsetRegistryRegistrationTest, RejectsDuplicateAndUnmaskableIds) {
    CapsetRegistry registry;
    EXPECT_EQ(registry.registerCapset(makeCapset(5, 1), ComponentType::kCrossDomain),
              BrokerResult::kOk);
    EXPECT_EQ(registry.registerCapset(makeCapset(5, 2), ComponentType::kStub),
              BrokerResult::kAlreadyExists);
    EXPECT_EQ(registry.registerCapset(makeCapset(64, 1), ComponentType::kStub),
              BrokerResult::kInvalidArgument);
    EXPECT_EQ(registry.count(CapsetRegistry::kAllCapsets), 1u);
}

TEST(CapsetRegistryDeathTest, RegisterAfterFreezeAborts) {
    CapsetRegistry registry;
    registry.freeze();
    EXPECT_DEATH({ registry.registerCapset(makeCapset(1, 1), ComponentType::kNativeRender); },
                 R"re(capset 1 registered after the broker was assembled)re");
}

}  // namespace
}  // namespace gfxbroker
