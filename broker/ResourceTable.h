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
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

#include "BrokerTypes.h"
#include "aemu/base/ManagedDescriptor.hpp"
#include "aemu/base/synchronization/Lock.h"

namespace gfxbroker {

enum class BackingKind {
    kNone,
    // Guest pages attached with attachBacking, or the iovecs of a guest blob.
    kGuestIovecs,
    // Memory the backend allocated on the host.
    kHostMemory,
};

// Snapshot of a resource's bookkeeping. Returned by value so callers never hold references into
// the table.
struct ResourceInfo {
    ResourceId id = kInvalidResourceId;
    // Backend that owns the resource's storage.
    ComponentType component = ComponentType::k2D;
    // Every backend that knows about the resource, one componentBit() each.
    uint32_t componentMask = 0;
    ContextId ownerCtx = kNoContext;
    bool isBlob = false;
    ResourceCreateArgs args;
    BlobCreateArgs blobArgs;
    uint64_t size = 0;
    // Row pitch guests should assume for non-blob resources.
    uint32_t stride = 0;
    BackingKind backing = BackingKind::kNone;
    size_t numIovecs = 0;
    uint32_t mapInfo = 0;
    bool hasHostMapping = false;
    bool exported = false;
    ExportedHandle exportHandle;
    uint32_t scanoutRefs = 0;
    std::vector<ContextId> attachedContexts;

    bool cpuMappable() const {
        return isBlob && (blobArgs.blobFlags & kBlobFlagUseMappable) && hasHostMapping;
    }
    bool shareable() const {
        return isBlob &&
               (blobArgs.blobFlags & (kBlobFlagUseShareable | kBlobFlagUseCrossDevice));
    }
};

// Owner of resource identity. Ids are handed out monotonically and never recycled, so a stale id
// always reads as kNotFound. All members are safe to call from any thread; every operation on
// one id is serialized by the table lock.
class ResourceTable {
   public:
    ResourceTable() = default;
    ResourceTable(const ResourceTable&) = delete;
    ResourceTable& operator=(const ResourceTable&) = delete;

    // Fails with kUnsupported once the 32 bit id space is exhausted.
    BrokerResult allocateId(ResourceId* outId);

    BrokerResult insert(ResourceInfo info, IovecList iovecs, ResourceMapping mapping);

    BrokerResult lookup(ResourceId id, ResourceInfo* outInfo) const;
    bool contains(ResourceId id) const;

    // kUnsupported unless the resource is CPU mappable.
    BrokerResult getMapping(ResourceId id, ResourceMapping* outMapping) const;
    BrokerResult getBacking(ResourceId id, IovecList* outIovecs) const;
    // Forgets the host mapping. The resource is no longer CPU mappable afterwards.
    BrokerResult clearMapping(ResourceId id);

    BrokerResult attachBacking(ResourceId id, IovecList iovecs);
    BrokerResult detachBacking(ResourceId id);

    // Resources are exclusive to one context unless they are shareable blobs. Attaching to the
    // same context twice is harmless.
    BrokerResult attachToContext(ResourceId id, ContextId ctxId);
    BrokerResult detachFromContext(ResourceId id, ContextId ctxId);
    std::vector<ResourceId> detachAllFromContext(ContextId ctxId);
    std::vector<ResourceId> resourcesAttachedTo(ContextId ctxId) const;

    // Installs the canonical descriptor unless another export won the race, in which case the
    // existing handle is returned and descriptor is closed.
    BrokerResult publishExport(ResourceId id, android::base::ManagedDescriptor descriptor,
                               uint32_t handleType, ExportedHandle* outHandle);

    // Returns a dup() of the canonical descriptor that the caller owns.
    BrokerResult duplicateExport(ResourceId id, android::base::ManagedDescriptor* outDescriptor,
                                 uint32_t* outHandleType) const;

    BrokerResult addScanoutRef(ResourceId id);
    BrokerResult removeScanoutRef(ResourceId id);

    // Removes the resource unless a scanout or a pending fence still references it.
    BrokerResult remove(ResourceId id, const std::function<bool(ResourceId)>& hasPendingFences,
                        ResourceInfo* outRemoved);

    size_t size() const;

   private:
    struct Entry {
        ResourceInfo info;
        IovecList iovecs;
        ResourceMapping mapping;
        std::optional<android::base::ManagedDescriptor> canonicalExport;
        std::set<ContextId> contexts;
    };

    ResourceInfo snapshotLocked(const Entry& entry) const;

    mutable android::base::Lock mLock;
    uint64_t mNextId = 1;
    std::unordered_map<ResourceId, Entry> mResources;
    std::map<ContextId, std::set<ResourceId>> mContextResources;
};

}  // namespace gfxbroker
