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

#include "FenceHandler.h"

#include <cinttypes>
#include <utility>

#include "InvariantViolation.h"
#include "aemu/base/system/System.h"
#include "base/Metrics.h"
#include "host-common/logging.h"

namespace gfxbroker {

using android::base::AutoLock;

FenceHandler::FenceHandler(CompletionSink sink) : mSink(std::move(sink)) {}

Fence FenceHandler::registerPending(const FenceRing& ring, std::vector<ResourceId> resources) {
    AutoLock lock(mLock);

    FenceId id = mNextSeq++;
    for (ResourceId resourceId : resources) {
        ++mResourceRefs[resourceId];
    }
    auto fence = std::make_shared<PendingFence>(
        PendingFence{.id = id, .ring = ring, .resources = std::move(resources)});
    mPending[id] = fence;
    mRingQueues[ring].emplace_back(std::move(fence));
    FENCE_DEBUG_LOG("fence %" PRIu64 " pending on %s", id, to_string(ring).c_str());
    return Fence{.id = id, .ring = ring};
}

BrokerResult FenceHandler::signal(const FenceRing& ring, FenceId seq) {
    AutoLock lock(mLock);

    if (seq == kInvalidFenceId || seq >= mNextSeq) {
        ERR("Fence %" PRIu64 " signaled on %s was never issued.", seq, to_string(ring).c_str());
        GFXBROKER_REPORT_INVARIANT_VIOLATION(contextOf(ring), seq, "signal for unissued fence");
        return BrokerResult::kInvariantViolation;
    }

    auto pendingIt = mPending.find(seq);
    if (pendingIt != mPending.end()) {
        PendingFence& fence = *pendingIt->second;
        if (!(fence.ring == ring)) {
            ERR("Fence %" PRIu64 " belongs to %s but was signaled on %s.", seq,
                to_string(fence.ring).c_str(), to_string(ring).c_str());
            GFXBROKER_REPORT_INVARIANT_VIOLATION(contextOf(ring), seq,
                                                 "signal from a ring that does not own the fence");
            return BrokerResult::kInvariantViolation;
        }
        if (fence.completed) {
            FENCE_DEBUG_LOG("fence %" PRIu64 " signaled twice", seq);
            return BrokerResult::kOk;
        }
        fence.completed = true;
        pollLocked(ring);
        return BrokerResult::kOk;
    }

    auto retiredIt = mRetired.find(seq);
    if (retiredIt != mRetired.end() && !(retiredIt->second == ring)) {
        ERR("Retired fence %" PRIu64 " of %s signaled on %s.", seq,
            to_string(retiredIt->second).c_str(), to_string(ring).c_str());
        GFXBROKER_REPORT_INVARIANT_VIOLATION(contextOf(ring), seq,
                                             "late signal from a ring that does not own the fence");
        return BrokerResult::kInvariantViolation;
    }

    // Retired already, possibly garbage collected since.
    FENCE_DEBUG_LOG("late signal for retired fence %" PRIu64, seq);
    return BrokerResult::kOk;
}

void FenceHandler::discard(FenceId seq) {
    AutoLock lock(mLock);

    auto pendingIt = mPending.find(seq);
    if (pendingIt == mPending.end()) {
        return;
    }
    std::shared_ptr<PendingFence> fence = pendingIt->second;
    RingQueue& queue = mRingQueues[fence->ring];
    queue.remove(fence);
    retireLocked(*fence, /*notify=*/false);
    pollLocked(fence->ring);
}

size_t FenceHandler::abandonContext(ContextId ctxId) {
    AutoLock lock(mLock);

    size_t retired = 0;
    for (auto it = mRingQueues.begin(); it != mRingQueues.end();) {
        const auto* contextRing = std::get_if<FenceRingContextSpecific>(&it->first);
        if (!contextRing || contextRing->ctxId != ctxId) {
            ++it;
            continue;
        }
        for (auto& fence : it->second) {
            retireLocked(*fence, /*notify=*/true);
            ++retired;
        }
        it = mRingQueues.erase(it);
    }
    if (retired) {
        mCv.broadcast();
    }
    return retired;
}

FenceState FenceHandler::stateLocked(FenceId seq) const {
    return mPending.count(seq) ? FenceState::kPending : FenceState::kSignaled;
}

BrokerResult FenceHandler::poll(FenceId seq, FenceState* state) const {
    AutoLock lock(mLock);

    if (seq == kInvalidFenceId || seq >= mNextSeq) {
        return BrokerResult::kNotFound;
    }
    *state = stateLocked(seq);
    return BrokerResult::kOk;
}

BrokerResult FenceHandler::ringOf(FenceId seq, FenceRing* outRing) const {
    AutoLock lock(mLock);

    auto pending = mPending.find(seq);
    if (pending != mPending.end()) {
        *outRing = pending->second->ring;
        return BrokerResult::kOk;
    }
    auto retired = mRetired.find(seq);
    if (retired != mRetired.end()) {
        *outRing = retired->second;
        return BrokerResult::kOk;
    }
    return BrokerResult::kNotFound;
}

BrokerResult FenceHandler::wait(FenceId seq, uint64_t timeoutUs, FenceState* state) {
    AutoLock lock(mLock);

    if (seq == kInvalidFenceId || seq >= mNextSeq) {
        return BrokerResult::kNotFound;
    }

    const uint64_t start = android::base::getUnixTimeUs();
    const uint64_t deadline =
        timeoutUs > kWaitForever - start ? kWaitForever : start + timeoutUs;
    while (stateLocked(seq) == FenceState::kPending) {
        if (timeoutUs == 0) {
            break;
        }
        if (deadline == kWaitForever) {
            mCv.wait(&mLock);
            continue;
        }
        mCv.timedWait(&mLock, deadline);
        if (stateLocked(seq) == FenceState::kPending &&
            android::base::getUnixTimeUs() >= deadline) {
            base::CreateMetricsLogger()->logMetricEvent(base::FenceWaitTimeout{
                .fenceId = seq, .waited_ms = static_cast<int64_t>(timeoutUs / 1000)});
            break;
        }
    }
    *state = stateLocked(seq);
    return BrokerResult::kOk;
}

bool FenceHandler::hasPendingReferences(ResourceId resourceId) const {
    AutoLock lock(mLock);
    auto it = mResourceRefs.find(resourceId);
    return it != mResourceRefs.end() && it->second > 0;
}

bool FenceHandler::hasPendingForContext(ContextId ctxId) const {
    AutoLock lock(mLock);
    for (const auto& [ring, queue] : mRingQueues) {
        if (contextOf(ring) == ctxId && ctxId != kNoContext && !queue.empty()) {
            return true;
        }
    }
    return false;
}

void FenceHandler::markObserved(FenceId upTo) {
    AutoLock lock(mLock);
    mRetired.erase(mRetired.begin(), mRetired.upper_bound(upTo));
}

void FenceHandler::retireLocked(PendingFence& fence, bool notify) {
    for (ResourceId resourceId : fence.resources) {
        auto it = mResourceRefs.find(resourceId);
        if (it != mResourceRefs.end() && --it->second == 0) {
            mResourceRefs.erase(it);
        }
    }
    mRetired.emplace(fence.id, fence.ring);
    mPending.erase(fence.id);
    FENCE_DEBUG_LOG("fence %" PRIu64 " retired", fence.id);
    if (notify && mSink) {
        mSink(FenceCompletion{.id = fence.id, .ring = fence.ring});
    }
}

void FenceHandler::pollLocked(const FenceRing& ring) {
    auto iQueue = mRingQueues.find(ring);
    if (iQueue == mRingQueues.end()) {
        return;
    }
    RingQueue& queue = iQueue->second;
    bool retiredAny = false;
    while (!queue.empty() && queue.front()->completed) {
        // Keep the fence alive across the erase from mPending.
        std::shared_ptr<PendingFence> fence = queue.front();
        queue.pop_front();
        retireLocked(*fence, /*notify=*/true);
        retiredAny = true;
    }
    if (queue.empty()) {
        mRingQueues.erase(iQueue);
    }
    if (retiredAny) {
        mCv.broadcast();
    }
}

}  // namespace gfxbroker
