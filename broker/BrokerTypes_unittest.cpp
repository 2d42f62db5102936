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

#include <unordered_set>

#include "BrokerTypes.h"
#include "base/testing/TestUtils.h"

namespace gfxbroker {
namespace {

TEST(BrokerTypesTest, RingsPrintTheirOwner) {
    EXPECT_THAT(to_string(FenceRingGlobal{}), MatchesStdRegex("global"));
    EXPECT_THAT(to_string(FenceRingContextSpecific{.ctxId = 12, .ringIdx = 3}),
                MatchesStdRegex(".*ctx = 12.*ring = 3.*"));
    EXPECT_EQ(contextOf(FenceRingGlobal{}), kNoContext);
    EXPECT_EQ(contextOf(FenceRingContextSpecific{.ctxId = 12, .ringIdx = 3}), 12u);
}

TEST(BrokerTypesTest, RingsHashApart) {
    FenceRingHash hash;
    std::unordered_set<size_t> hashes = {
        hash(FenceRingGlobal{}),
        hash(FenceRingContextSpecific{.ctxId = 0, .ringIdx = 0}),
        hash(FenceRingContextSpecific{.ctxId = 1, .ringIdx = 0}),
        hash(FenceRingContextSpecific{.ctxId = 1, .ringIdx = 1}),
    };
    EXPECT_EQ(hashes.size(), 4u);
    EXPECT_NE(FenceRing(FenceRingContextSpecific{1, 0}), FenceRing(FenceRingContextSpecific{1, 1}));
}

TEST(BrokerTypesTest, ResultsHaveNames) {
    EXPECT_STREQ(toString(BrokerResult::kInUse), "InUse");
    EXPECT_THAT(toString(BrokerResult::kInvariantViolation), ContainsStdRegex("Violation"));
    EXPECT_STREQ(toString(ComponentType::kCrossDomain), "cross-domain");
}

TEST(BrokerTypesTest, ResponsesFollowTheScope) {
    EXPECT_EQ(virtioGpuResponseFor(BrokerResult::kOk, ResponseScope::kOther),
              kVirtioGpuRespOkNodata);
    EXPECT_EQ(virtioGpuResponseFor(BrokerResult::kNotFound, ResponseScope::kResource),
              kVirtioGpuRespErrInvalidResourceId);
    EXPECT_EQ(virtioGpuResponseFor(BrokerResult::kNotFound, ResponseScope::kContext),
              kVirtioGpuRespErrInvalidContextId);
    EXPECT_EQ(virtioGpuResponseFor(BrokerResult::kOutOfRange, ResponseScope::kScanout),
              kVirtioGpuRespErrInvalidScanoutId);
    EXPECT_EQ(virtioGpuResponseFor(BrokerResult::kInvalidArgument, ResponseScope::kScanout),
              kVirtioGpuRespErrInvalidParameter);
    EXPECT_EQ(virtioGpuResponseFor(BrokerResult::kInUse, ResponseScope::kResource),
              kVirtioGpuRespErrUnspec);
    EXPECT_EQ(virtioGpuResponseFor(BrokerResult::kBackendFailure, ResponseScope::kContext),
              kVirtioGpuRespErrUnspec);
}

}  // namespace
}  // namespace gfxbroker
