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

#include <cstdlib>

#include "BrokerConfig.h"

namespace gfxbroker {
namespace {

class BrokerConfigTest : public ::testing::Test {
   protected:
    void TearDown() override {
        unsetenv("GFXBROKER_CAPSET_MASK");
        unsetenv("GFXBROKER_NUM_SCANOUTS");
        unsetenv("GFXBROKER_VERBOSE");
    }
};

TEST(BrokerConfigParseTest, AcceptsDecimalAndHex) {
    EXPECT_EQ(parseConfigValue("12"), 12u);
    EXPECT_EQ(parseConfigValue("0x20"), 0x20u);
    EXPECT_EQ(parseConfigValue("0xffffffffffffffff"), UINT64_MAX);
    EXPECT_EQ(parseConfigValue(""), std::nullopt);
    EXPECT_EQ(parseConfigValue("12abc"), std::nullopt);
    EXPECT_EQ(parseConfigValue("-1"), std::nullopt);
}

TEST_F(BrokerConfigTest, DefaultsWithoutEnvironment) {
    BrokerConfig config = BrokerConfig::fromEnvironment();
    EXPECT_EQ(config.capsetMask, CapsetRegistry::kAllCapsets);
    EXPECT_EQ(config.defaultComponent, ComponentType::k2D);
    EXPECT_EQ(config.numScanouts, 1u);
    EXPECT_FALSE(config.verbose);
}

TEST_F(BrokerConfigTest, EnvironmentOverridesBase) {
    setenv("GFXBROKER_CAPSET_MASK", "0xa0", 1);
    setenv("GFXBROKER_NUM_SCANOUTS", "4", 1);
    setenv("GFXBROKER_VERBOSE", "1", 1);

    BrokerConfig base;
    base.defaultComponent = ComponentType::kNativeRender;
    BrokerConfig config = BrokerConfig::fromEnvironment(base);
    EXPECT_EQ(config.capsetMask, 0xa0u);
    EXPECT_EQ(config.numScanouts, 4u);
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.defaultComponent, ComponentType::kNativeRender);
}

TEST_F(BrokerConfigTest, MalformedValuesAreIgnored) {
    setenv("GFXBROKER_CAPSET_MASK", "all", 1);
    setenv("GFXBROKER_NUM_SCANOUTS", "17", 1);
    setenv("GFXBROKER_VERBOSE", "0", 1);

    BrokerConfig base;
    base.capsetMask = 0x3;
    base.numScanouts = 2;
    base.verbose = true;
    BrokerConfig config = BrokerConfig::fromEnvironment(base);
    EXPECT_EQ(config.capsetMask, 0x3u);
    EXPECT_EQ(config.numScanouts, 2u);
    EXPECT_FALSE(config.verbose);
}

}  // namespace
}  // namespace gfxbroker
