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

#include <mutex>
#include <thread>
#include <vector>

#include "FenceNotifier.h"

namespace gfxbroker {
namespace {

using ::testing::ElementsAre;

TEST(FenceNotifierTest, DeliversInOrder) {
    std::mutex mutex;
    std::vector<FenceId> delivered;
    std::thread::id callbackThread;
    FenceNotifier notifier([&](const FenceCompletion& completion) {
        std::lock_guard<std::mutex> lock(mutex);
        delivered.push_back(completion.id);
        callbackThread = std::this_thread::get_id();
    });

    notifier.notify(FenceCompletion{.id = 3, .ring = FenceRingGlobal{}});
    notifier.notify(FenceCompletion{.id = 1, .ring = FenceRingContextSpecific{1, 0}});
    notifier.notify(FenceCompletion{.id = 2, .ring = FenceRingGlobal{}});
    notifier.waitForPendingNotifications();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_THAT(delivered, ElementsAre(3, 1, 2));
    EXPECT_NE(callbackThread, std::this_thread::get_id());
}

TEST(FenceNotifierTest, StopIsIdempotent) {
    int calls = 0;
    FenceNotifier notifier([&](const FenceCompletion&) { ++calls; });
    notifier.notify(FenceCompletion{.id = 1, .ring = FenceRingGlobal{}});
    notifier.stop();
    notifier.stop();
    EXPECT_EQ(calls, 1);
}

}  // namespace
}  // namespace gfxbroker
