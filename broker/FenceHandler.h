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

#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <unordered_map>
#include <vector>

#include "BrokerTypes.h"
#include "aemu/base/synchronization/ConditionVariable.h"
#include "aemu/base/synchronization/Lock.h"

namespace gfxbroker {

// Turns completion signals from any number of backend threads into one guest-visible fence
// stream.
//
// Fence ids come from a single counter per broker. Each fence belongs to a ring (the global ring
// or a context ring) and every ring is a FIFO timeline: a fence is retired, and reported to the
// completion sink, only once it and every earlier fence on the same ring have been signaled.
// Signals that arrive early are recorded and take effect when the ring catches up.
//
// The sink is called with the handler's lock held and must not call back into the handler.
class FenceHandler {
   public:
    using CompletionSink = std::function<void(const FenceCompletion&)>;

    static constexpr uint64_t kWaitForever = UINT64_MAX;

    explicit FenceHandler(CompletionSink sink);
    FenceHandler(const FenceHandler&) = delete;
    FenceHandler& operator=(const FenceHandler&) = delete;

    // Allocates the next fence id on the ring. The listed resources cannot be destroyed until the
    // fence retires.
    Fence registerPending(const FenceRing& ring, std::vector<ResourceId> resources = {});

    // Marks seq as completed. Signaling an already signaled fence is a no-op. Signaling an id that
    // was never handed out, or from a ring that does not own it, is an invariant violation.
    BrokerResult signal(const FenceRing& ring, FenceId seq);

    // Drops a fence whose work was never accepted. The fence is not reported to the sink.
    void discard(FenceId seq);

    // Retires every outstanding fence on the context's rings, in ring order, and returns how many
    // were retired. Later signals for them are no-ops.
    size_t abandonContext(ContextId ctxId);

    BrokerResult poll(FenceId seq, FenceState* state) const;
    // The ring of a pending or not yet collected fence.
    BrokerResult ringOf(FenceId seq, FenceRing* outRing) const;

    // Blocks until seq is signaled or timeoutUs passes. A timeout of zero only polls. On timeout
    // the result is kOk with *state left at kPending.
    BrokerResult wait(FenceId seq, uint64_t timeoutUs, FenceState* state);

    bool hasPendingReferences(ResourceId resourceId) const;
    bool hasPendingForContext(ContextId ctxId) const;

    // Forgets retired fences up to and including upTo. They keep polling as signaled.
    void markObserved(FenceId upTo);

   private:
    struct PendingFence {
        FenceId id;
        FenceRing ring;
        std::vector<ResourceId> resources;
        bool completed = false;
    };
    using RingQueue = std::list<std::shared_ptr<PendingFence>>;

    FenceState stateLocked(FenceId seq) const;
    void retireLocked(PendingFence& fence, bool notify);
    void pollLocked(const FenceRing& ring);

    CompletionSink mSink;

    mutable android::base::Lock mLock;
    android::base::ConditionVariable mCv;
    FenceId mNextSeq = 1;
    std::unordered_map<FenceRing, RingQueue, FenceRingHash> mRingQueues;
    std::unordered_map<FenceId, std::shared_ptr<PendingFence>> mPending;
    // Retired fences that have not been garbage collected, kept to answer late signals.
    std::map<FenceId, FenceRing> mRetired;
    std::unordered_map<ResourceId, uint32_t> mResourceRefs;
};

}  // namespace gfxbroker
