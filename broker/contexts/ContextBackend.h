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

#include <sys/uio.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "BrokerTypes.h"
#include "ResourceTable.h"
#include "aemu/base/ManagedDescriptor.hpp"
#include "base/AsyncResult.h"

namespace gfxbroker {

// What a backend context sees of a resource attached to it.
struct ContextResource {
    ResourceId id = kInvalidResourceId;
    uint32_t blobMem = 0;
    IovecList iovecs;
    ResourceMapping mapping;
};

// Storage a backend produced for a new resource. A null mapping means the resource has no host
// pages the broker can hand out.
struct BackendResource {
    uint64_t size = 0;
    uint32_t mapInfo = 0;
    ResourceMapping mapping;
};

struct ExportedDescriptor {
    android::base::ManagedDescriptor descriptor;
    uint32_t handleType = 0;
};

// The narrow surface the broker exposes to backends. Backends never reach into the resource
// table or into another backend.
class BackendHost {
   public:
    virtual ~BackendHost() = default;

    // Reports completion of a fence the backend accepted with OK_AND_CALLBACK_SCHEDULED. Safe to
    // call from any thread.
    virtual BrokerResult signalFence(const FenceRing& ring, FenceId id) = 0;

    virtual BrokerResult lookupResource(ResourceId id, ResourceInfo* outInfo) const = 0;

    // A new descriptor for the resource's exported handle, exporting it first if needed. Must not
    // be called with backend locks held.
    virtual BrokerResult duplicateResourceHandle(ResourceId id,
                                                 android::base::ManagedDescriptor* outDescriptor,
                                                 uint32_t* outHandleType) = 0;
};

// One guest context bound to a backend.
class BackendContext {
   public:
    virtual ~BackendContext() = default;

    virtual ComponentType componentType() const = 0;

    // Queues a command stream. The fence has already been registered; outResult tells the broker
    // who completes it:
    //   OK_AND_CALLBACK_SCHEDULED     the backend calls BackendHost::signalFence later,
    //   OK_AND_CALLBACK_FIRED         the backend already did,
    //   OK_AND_CALLBACK_NOT_SCHEDULED the broker signals it right away,
    //   FAIL_AND_CALLBACK_NOT_SCHEDULED the fence is dropped.
    virtual BrokerResult submit(const CommandBuffer& commands, const Fence& fence,
                                base::AsyncResult* outResult) = 0;

    // Blobs whose blob id names an object the context created earlier.
    virtual BrokerResult createBlob(ResourceId, const BlobCreateArgs&, BackendResource*) {
        return BrokerResult::kUnsupported;
    }

    virtual BrokerResult attachResource(const ContextResource& resource) = 0;
    virtual void detachResource(ResourceId id) = 0;
};

// A rendering component. Owns the backend state of every resource it created and produces
// contexts for the capsets it advertises.
class ContextBackend {
   public:
    virtual ~ContextBackend() = default;

    virtual ComponentType componentType() const = 0;
    virtual std::vector<CapsetDescriptor> capsets() const = 0;

    // Called once while the broker is assembled. The host outlives the backend.
    virtual BrokerResult initialize(BackendHost* host) = 0;

    virtual BrokerResult createContext(ContextId ctxId, uint32_t capsetId, const std::string& name,
                                       std::unique_ptr<BackendContext>* outContext) = 0;

    virtual BrokerResult createResource(ResourceId id, const ResourceCreateArgs& args,
                                        BackendResource* outResource) = 0;
    virtual BrokerResult createBlob(ResourceId id, const BlobCreateArgs& args,
                                    const IovecList& iovecs, BackendResource* outResource) = 0;

    virtual BrokerResult attachBacking(ResourceId id, const IovecList& iovecs) = 0;
    virtual void detachBacking(ResourceId id) = 0;

    virtual BrokerResult transferToHost(ContextId ctxId, ResourceId id, const TransferBox& box) = 0;
    // Reads back into dst, or into the attached backing when dst is null.
    virtual BrokerResult transferFromHost(ContextId ctxId, ResourceId id, const TransferBox& box,
                                          const IovecList* dst) = 0;

    virtual BrokerResult exportResource(ResourceId, ExportedDescriptor*) {
        return BrokerResult::kUnsupported;
    }

    // Called before the broker stops handing out the resource's mapping. Backends that keep
    // their pages until destroyResource have nothing to do.
    virtual BrokerResult unmapResource(ResourceId) { return BrokerResult::kOk; }

    // A descriptor that signals when fenceId, a fence on the context's ring, completes.
    virtual BrokerResult exportFence(ContextId, uint8_t /*ringIdx*/, FenceId,
                                     ExportedDescriptor*) {
        return BrokerResult::kUnsupported;
    }

    virtual void destroyResource(ResourceId id) = 0;

    virtual void onScanoutBound(ResourceId, const ScanoutInfo&) {}
};

}  // namespace gfxbroker
