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

#include <chrono>
#include <thread>
#include <vector>

#include "FenceHandler.h"

namespace gfxbroker {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class FenceHandlerTest : public ::testing::Test {
   protected:
    FenceHandlerTest()
        : mHandler([this](const FenceCompletion& completion) {
              mCompleted.push_back(completion.id);
          }) {}

    FenceState stateOf(FenceId id) {
        FenceState state = FenceState::kPending;
        EXPECT_EQ(mHandler.poll(id, &state), BrokerResult::kOk);
        return state;
    }

    const FenceRing mRing1 = FenceRingContextSpecific{.ctxId = 1, .ringIdx = 0};
    const FenceRing mRing2 = FenceRingContextSpecific{.ctxId = 2, .ringIdx = 0};
    std::vector<FenceId> mCompleted;
    FenceHandler mHandler;
};

TEST_F(FenceHandlerTest, IdsAreMonotonicAcrossRings) {
    Fence a = mHandler.registerPending(mRing1);
    Fence b = mHandler.registerPending(mRing2);
    Fence c = mHandler.registerPending(FenceRingGlobal{});
    EXPECT_EQ(a.id, 1u);
    EXPECT_LT(a.id, b.id);
    EXPECT_LT(b.id, c.id);
    FenceState state;
    EXPECT_EQ(mHandler.poll(c.id + 1, &state), BrokerResult::kNotFound);
}

TEST_F(FenceHandlerTest, CompletionFollowsRingOrder) {
    Fence first = mHandler.registerPending(mRing1);
    Fence second = mHandler.registerPending(mRing1);

    ASSERT_EQ(mHandler.signal(mRing1, second.id), BrokerResult::kOk);
    EXPECT_THAT(mCompleted, IsEmpty());
    EXPECT_EQ(stateOf(second.id), FenceState::kPending);

    ASSERT_EQ(mHandler.signal(mRing1, first.id), BrokerResult::kOk);
    EXPECT_THAT(mCompleted, ElementsAre(first.id, second.id));
    EXPECT_EQ(stateOf(first.id), FenceState::kSignaled);
    EXPECT_EQ(stateOf(second.id), FenceState::kSignaled);
}

TEST_F(FenceHandlerTest, RingsCompleteIndependently) {
    Fence blocked = mHandler.registerPending(mRing1);
    Fence other = mHandler.registerPending(mRing2);

    ASSERT_EQ(mHandler.signal(mRing2, other.id), BrokerResult::kOk);
    EXPECT_THAT(mCompleted, ElementsAre(other.id));
    EXPECT_EQ(stateOf(blocked.id), FenceState::kPending);
}

TEST_F(FenceHandlerTest, DuplicateSignalIsNoOp) {
    Fence fence = mHandler.registerPending(mRing1);
    EXPECT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk);
    EXPECT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk);
    EXPECT_THAT(mCompleted, ElementsAre(fence.id));
    EXPECT_EQ(stateOf(fence.id), FenceState::kSignaled);
    EXPECT_EQ(stateOf(fence.id), FenceState::kSignaled);
}

TEST_F(FenceHandlerTest, SignalForUnissuedFenceIsInvariantViolation) {
    EXPECT_EQ(mHandler.signal(mRing1, 0), BrokerResult::kInvariantViolation);
    EXPECT_EQ(mHandler.signal(mRing1, 7), BrokerResult::kInvariantViolation);
    EXPECT_THAT(mCompleted, IsEmpty());
}

TEST_F(FenceHandlerTest, SignalFromForeignRingIsInvariantViolation) {
    Fence fence = mHandler.registerPending(mRing1);
    EXPECT_EQ(mHandler.signal(mRing2, fence.id), BrokerResult::kInvariantViolation);
    EXPECT_EQ(stateOf(fence.id), FenceState::kPending);

    ASSERT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk);
    EXPECT_EQ(mHandler.signal(mRing2, fence.id), BrokerResult::kInvariantViolation);
}

TEST_F(FenceHandlerTest, PollUnknownFence) {
    FenceState state;
    EXPECT_EQ(mHandler.poll(0, &state), BrokerResult::kNotFound);
    EXPECT_EQ(mHandler.poll(1, &state), BrokerResult::kNotFound);
}

TEST_F(FenceHandlerTest, PendingFenceHoldsResourceReferences) {
    Fence fence = mHandler.registerPending(mRing1, {10, 11});
    EXPECT_TRUE(mHandler.hasPendingReferences(10));
    EXPECT_TRUE(mHandler.hasPendingReferences(11));
    EXPECT_FALSE(mHandler.hasPendingReferences(12));

    ASSERT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk);
    EXPECT_FALSE(mHandler.hasPendingReferences(10));
    EXPECT_FALSE(mHandler.hasPendingReferences(11));
}

TEST_F(FenceHandlerTest, DiscardUnblocksRingWithoutNotification) {
    Fence dropped = mHandler.registerPending(mRing1, {10});
    Fence next = mHandler.registerPending(mRing1);
    ASSERT_EQ(mHandler.signal(mRing1, next.id), BrokerResult::kOk);
    EXPECT_THAT(mCompleted, IsEmpty());

    mHandler.discard(dropped.id);
    EXPECT_THAT(mCompleted, ElementsAre(next.id));
    EXPECT_FALSE(mHandler.hasPendingReferences(10));
}

TEST_F(FenceHandlerTest, AbandonContextRetiresItsRingsOnly) {
    Fence a = mHandler.registerPending(mRing1);
    Fence b = mHandler.registerPending(FenceRingContextSpecific{.ctxId = 1, .ringIdx = 3});
    Fence c = mHandler.registerPending(mRing2);
    EXPECT_TRUE(mHandler.hasPendingForContext(1));

    EXPECT_EQ(mHandler.abandonContext(1), 2u);
    EXPECT_FALSE(mHandler.hasPendingForContext(1));
    EXPECT_TRUE(mHandler.hasPendingForContext(2));
    EXPECT_EQ(stateOf(a.id), FenceState::kSignaled);
    EXPECT_EQ(stateOf(b.id), FenceState::kSignaled);
    EXPECT_EQ(stateOf(c.id), FenceState::kPending);

    // The backend may still report the abandoned work.
    EXPECT_EQ(mHandler.signal(mRing1, a.id), BrokerResult::kOk);
}

TEST_F(FenceHandlerTest, ObservedFencesStaySignaled) {
    Fence fence = mHandler.registerPending(mRing1);
    ASSERT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk);
    mHandler.markObserved(fence.id);
    EXPECT_EQ(stateOf(fence.id), FenceState::kSignaled);
    EXPECT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk);
    EXPECT_THAT(mCompleted, ElementsAre(fence.id));
}

TEST_F(FenceHandlerTest, RingIsKnownUntilCollected) {
    Fence fence = mHandler.registerPending(mRing2);
    FenceRing ring;
    ASSERT_EQ(mHandler.ringOf(fence.id, &ring), BrokerResult::kOk);
    EXPECT_TRUE(ring == mRing2);

    ASSERT_EQ(mHandler.signal(mRing2, fence.id), BrokerResult::kOk);
    ASSERT_EQ(mHandler.ringOf(fence.id, &ring), BrokerResult::kOk);
    EXPECT_TRUE(ring == mRing2);

    mHandler.markObserved(fence.id);
    EXPECT_EQ(mHandler.ringOf(fence.id, &ring), BrokerResult::kNotFound);
    EXPECT_EQ(mHandler.ringOf(fence.id + 1, &ring), BrokerResult::kNotFound);
}

TEST_F(FenceHandlerTest, WaitWithZeroTimeoutPolls) {
    Fence fence = mHandler.registerPending(mRing1);
    FenceState state = FenceState::kSignaled;
    EXPECT_EQ(mHandler.wait(fence.id, 0, &state), BrokerResult::kOk);
    EXPECT_EQ(state, FenceState::kPending);
}

TEST_F(FenceHandlerTest, WaitTimesOut) {
    Fence fence = mHandler.registerPending(mRing1);
    FenceState state = FenceState::kSignaled;
    EXPECT_EQ(mHandler.wait(fence.id, 1000, &state), BrokerResult::kOk);
    EXPECT_EQ(state, FenceState::kPending);
}

TEST_F(FenceHandlerTest, WaitWakesOnSignalFromAnotherThread) {
    Fence fence = mHandler.registerPending(mRing1);
    std::thread backend([&] { EXPECT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk); });

    FenceState state = FenceState::kPending;
    EXPECT_EQ(mHandler.wait(fence.id, FenceHandler::kWaitForever, &state), BrokerResult::kOk);
    EXPECT_EQ(state, FenceState::kSignaled);
    backend.join();
}

TEST_F(FenceHandlerTest, NearlyUnboundedTimeoutStillWaits) {
    Fence fence = mHandler.registerPending(mRing1);
    std::thread backend([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_EQ(mHandler.signal(mRing1, fence.id), BrokerResult::kOk);
    });

    FenceState state = FenceState::kPending;
    EXPECT_EQ(mHandler.wait(fence.id, FenceHandler::kWaitForever - 1, &state), BrokerResult::kOk);
    EXPECT_EQ(state, FenceState::kSignaled);
    backend.join();
}

TEST_F(FenceHandlerTest, ConcurrentSignalsAcrossRings) {
    constexpr int kFencesPerRing = 200;
    std::vector<Fence> ring1Fences;
    std::vector<Fence> ring2Fences;
    for (int i = 0; i < kFencesPerRing; ++i) {
        ring1Fences.push_back(mHandler.registerPending(mRing1));
        ring2Fences.push_back(mHandler.registerPending(mRing2));
    }

    auto signalAll = [this](const FenceRing& ring, const std::vector<Fence>& fences) {
        for (const Fence& fence : fences) {
            EXPECT_EQ(mHandler.signal(ring, fence.id), BrokerResult::kOk);
        }
    };
    std::thread t1(signalAll, mRing1, ring1Fences);
    std::thread t2(signalAll, mRing2, ring2Fences);
    t1.join();
    t2.join();

    EXPECT_EQ(mCompleted.size(), 2u * kFencesPerRing);
    EXPECT_FALSE(mHandler.hasPendingForContext(1));
    EXPECT_FALSE(mHandler.hasPendingForContext(2));
}

}  // namespace
}  // namespace gfxbroker
