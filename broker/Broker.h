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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "BrokerConfig.h"
#include "BrokerTypes.h"
#include "CapsetRegistry.h"
#include "ContextDispatcher.h"
#include "FenceHandler.h"
#include "FenceNotifier.h"
#include "ResourceTable.h"
#include "aemu/base/ManagedDescriptor.hpp"
#include "aemu/base/synchronization/Lock.h"
#include "contexts/ContextBackend.h"

namespace gfxbroker {

enum class ContextDestroyMode {
    // Fail with kInUse while the context has unsignaled fences.
    kRequireIdle,
    // Retire the context's outstanding fences and destroy it anyway.
    kAbandonPending,
};

// Entry point for the virtio-gpu protocol layer. Built by BrokerBuilder; the set of backends,
// the capset mask and the number of scanouts never change afterwards.
//
// Requests are expected from one protocol thread. Backends may signal fences from any thread.
class Broker : public BackendHost {
   public:
    ~Broker() override;

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;

    const BrokerConfig& config() const { return mConfig; }

    // Capsets

    uint32_t getCapsetCount() const;
    BrokerResult getCapsetInfo(uint32_t index, CapsetInfo* outInfo) const;
    // kNotFound for unknown or masked ids, kUnsupported for a version newer than registered.
    BrokerResult getCapset(uint32_t capsetId, uint32_t version,
                           std::vector<uint8_t>* outData) const;

    // Contexts

    BrokerResult createContext(uint32_t capsetId, uint32_t capsetVersion,
                               std::optional<ComponentType> hint, const std::string& name,
                               ContextId* outId);
    // Detaches, but does not destroy, every resource attached to the context.
    BrokerResult destroyContext(ContextId ctxId,
                                ContextDestroyMode mode = ContextDestroyMode::kRequireIdle);
    // Queues commands on the context and returns the fence registered on ring ringIdx.
    BrokerResult submit(ContextId ctxId, const CommandBuffer& commands, uint8_t ringIdx,
                        Fence* outFence);

    // Resources

    BrokerResult createResource(const ResourceCreateArgs& args, ResourceId* outId);
    BrokerResult createBlob(const BlobCreateArgs& args, IovecList iovecs, ResourceId* outId);
    // kInUse while a scanout or a pending fence references the resource.
    BrokerResult destroyResource(ResourceId id);
    BrokerResult getResourceInfo(ResourceId id, ResourceInfo* outInfo) const;

    BrokerResult attachBacking(ResourceId id, IovecList iovecs);
    BrokerResult detachBacking(ResourceId id);

    BrokerResult attachResource(ContextId ctxId, ResourceId id);
    BrokerResult detachResource(ContextId ctxId, ResourceId id);

    // ctxId may be kNoContext, in which case the fence lands on the global ring.
    BrokerResult transferToHost(ContextId ctxId, ResourceId id, const TransferBox& box,
                                Fence* outFence);
    BrokerResult transferFromHost(ContextId ctxId, ResourceId id, const TransferBox& box,
                                  const IovecList* dst, Fence* outFence);

    // The returned handle stays owned by the broker and is the same on every call.
    BrokerResult exportResource(ResourceId id, ExportedHandle* outHandle);
    // A dup() of the exported handle that the caller owns.
    BrokerResult exportResourceDuplicate(ResourceId id,
                                         android::base::ManagedDescriptor* outDescriptor,
                                         uint32_t* outHandleType);

    BrokerResult mapResource(ResourceId id, ResourceMapping* outMapping) const;
    // The mapping is gone for good afterwards. Scanned out resources are kInUse.
    BrokerResult unmapResource(ResourceId id);
    BrokerResult getMapInfo(ResourceId id, uint32_t* outMapInfo) const;

    // Scanouts

    BrokerResult setScanout(const ScanoutInfo& scanout);
    BrokerResult getScanout(uint32_t scanoutId, ScanoutInfo* outScanout) const;

    // Fences

    // Completes once every earlier fence on the global ring has completed.
    Fence createGlobalFence();
    BrokerResult pollFence(FenceId id, FenceState* outState) const;
    BrokerResult waitFence(FenceId id, uint64_t timeoutUs, FenceState* outState);
    // A caller-owned descriptor, usually a sync file, that signals with the fence. Only fences on
    // a context ring can be exported, and only until they are collected by markFencesObserved.
    BrokerResult exportFence(FenceId id, android::base::ManagedDescriptor* outDescriptor,
                             uint32_t* outHandleType);
    void markFencesObserved(FenceId upTo);
    void waitForPendingFenceNotifications();

    // BackendHost
    BrokerResult signalFence(const FenceRing& ring, FenceId id) override;
    BrokerResult lookupResource(ResourceId id, ResourceInfo* outInfo) const override;
    BrokerResult duplicateResourceHandle(ResourceId id,
                                         android::base::ManagedDescriptor* outDescriptor,
                                         uint32_t* outHandleType) override;

   private:
    friend class BrokerBuilder;

    explicit Broker(BrokerConfig config);

    ContextBackend* backendForResource(const ResourceInfo& info) const;
    BrokerResult finishFence(const Fence& fence, BrokerResult backendResult);
    BrokerResult validateScanout(const ScanoutInfo& scanout, const ResourceInfo& resource,
                                 ScanoutInfo* outNormalized) const;
    // Rejects boxes outside a classic resource and packed guest layouts that overrun memory.
    BrokerResult validateTransfer(const ResourceInfo& info, const TransferBox& box,
                                  const IovecList* dst) const;

    const BrokerConfig mConfig;
    // Only present when the embedder asked for fence callbacks.
    std::unique_ptr<FenceNotifier> mNotifier;
    FenceHandler mFences;
    CapsetRegistry mCapsets;
    ResourceTable mResources;

    mutable android::base::Lock mScanoutLock;
    std::vector<ScanoutInfo> mScanouts;

    // Last member so backend contexts, then backends, go away before the fence handler.
    ContextDispatcher mDispatcher;
};

}  // namespace gfxbroker
