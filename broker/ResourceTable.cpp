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

#include "ResourceTable.h"

#include <unistd.h>

#include <limits>
#include <utility>

#include "InvariantViolation.h"
#include "host-common/logging.h"

namespace gfxbroker {

using android::base::AutoLock;
using android::base::ManagedDescriptor;

BrokerResult ResourceTable::allocateId(ResourceId* outId) {
    AutoLock lock(mLock);
    if (mNextId > std::numeric_limits<ResourceId>::max()) {
        ERR("Resource id space exhausted.");
        return BrokerResult::kUnsupported;
    }
    *outId = static_cast<ResourceId>(mNextId++);
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::insert(ResourceInfo info, IovecList iovecs, ResourceMapping mapping) {
    AutoLock lock(mLock);

    const ResourceId id = info.id;
    if (id == kInvalidResourceId || id >= mNextId) {
        ERR("Resource %u was not allocated by this table.", id);
        GFXBROKER_REPORT_INVARIANT_VIOLATION(info.ownerCtx, 0, "insert of unallocated resource id");
        return BrokerResult::kInvariantViolation;
    }
    if (mResources.count(id)) {
        ERR("Resource %u already exists.", id);
        GFXBROKER_REPORT_INVARIANT_VIOLATION(info.ownerCtx, 0, "duplicate resource id");
        return BrokerResult::kAlreadyExists;
    }

    info.numIovecs = iovecs.size();
    if (!iovecs.empty()) {
        info.backing = BackingKind::kGuestIovecs;
    } else if (mapping.hva) {
        info.backing = BackingKind::kHostMemory;
    }
    info.hasHostMapping = mapping.hva != nullptr;
    info.exported = false;
    info.exportHandle = ExportedHandle{};
    info.scanoutRefs = 0;
    info.attachedContexts.clear();

    Entry entry;
    entry.info = std::move(info);
    entry.iovecs = std::move(iovecs);
    entry.mapping = mapping;
    mResources.emplace(id, std::move(entry));
    return BrokerResult::kOk;
}

ResourceInfo ResourceTable::snapshotLocked(const Entry& entry) const {
    ResourceInfo info = entry.info;
    info.attachedContexts.assign(entry.contexts.begin(), entry.contexts.end());
    return info;
}

BrokerResult ResourceTable::lookup(ResourceId id, ResourceInfo* outInfo) const {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    if (outInfo) {
        *outInfo = snapshotLocked(it->second);
    }
    return BrokerResult::kOk;
}

bool ResourceTable::contains(ResourceId id) const {
    AutoLock lock(mLock);
    return mResources.count(id) != 0;
}

BrokerResult ResourceTable::getMapping(ResourceId id, ResourceMapping* outMapping) const {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    if (!it->second.info.cpuMappable()) {
        return BrokerResult::kUnsupported;
    }
    *outMapping = it->second.mapping;
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::clearMapping(ResourceId id) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    if (!it->second.info.cpuMappable()) {
        return BrokerResult::kUnsupported;
    }
    it->second.info.hasHostMapping = false;
    it->second.mapping = ResourceMapping{};
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::getBacking(ResourceId id, IovecList* outIovecs) const {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    *outIovecs = it->second.iovecs;
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::attachBacking(ResourceId id, IovecList iovecs) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    Entry& entry = it->second;
    if (entry.info.backing == BackingKind::kHostMemory) {
        ERR("Resource %u is backed by host memory.", id);
        return BrokerResult::kUnsupported;
    }
    if (entry.info.backing == BackingKind::kGuestIovecs) {
        ERR("Resource %u already has backing attached.", id);
        return BrokerResult::kInvalidArgument;
    }
    if (iovecs.empty()) {
        return BrokerResult::kInvalidArgument;
    }
    entry.info.backing = BackingKind::kGuestIovecs;
    entry.info.numIovecs = iovecs.size();
    entry.iovecs = std::move(iovecs);
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::detachBacking(ResourceId id) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    Entry& entry = it->second;
    if (entry.info.backing != BackingKind::kGuestIovecs) {
        return BrokerResult::kInvalidArgument;
    }
    entry.info.backing = BackingKind::kNone;
    entry.info.numIovecs = 0;
    entry.iovecs.clear();
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::attachToContext(ResourceId id, ContextId ctxId) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    Entry& entry = it->second;
    if (entry.contexts.count(ctxId)) {
        return BrokerResult::kOk;
    }
    if (!entry.contexts.empty() && !entry.info.shareable()) {
        BROKER_DEBUG_LOG("resource %u is exclusively attached to context %u", id,
                         *entry.contexts.begin());
        return BrokerResult::kInUse;
    }
    entry.contexts.insert(ctxId);
    mContextResources[ctxId].insert(id);
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::detachFromContext(ResourceId id, ContextId ctxId) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    if (!it->second.contexts.erase(ctxId)) {
        return BrokerResult::kInvalidArgument;
    }
    auto ctxIt = mContextResources.find(ctxId);
    if (ctxIt != mContextResources.end()) {
        ctxIt->second.erase(id);
        if (ctxIt->second.empty()) {
            mContextResources.erase(ctxIt);
        }
    }
    return BrokerResult::kOk;
}

std::vector<ResourceId> ResourceTable::detachAllFromContext(ContextId ctxId) {
    AutoLock lock(mLock);
    std::vector<ResourceId> detached;
    auto ctxIt = mContextResources.find(ctxId);
    if (ctxIt == mContextResources.end()) {
        return detached;
    }
    for (ResourceId id : ctxIt->second) {
        auto it = mResources.find(id);
        if (it != mResources.end()) {
            it->second.contexts.erase(ctxId);
        }
        detached.push_back(id);
    }
    mContextResources.erase(ctxIt);
    return detached;
}

std::vector<ResourceId> ResourceTable::resourcesAttachedTo(ContextId ctxId) const {
    AutoLock lock(mLock);
    auto ctxIt = mContextResources.find(ctxId);
    if (ctxIt == mContextResources.end()) {
        return {};
    }
    return std::vector<ResourceId>(ctxIt->second.begin(), ctxIt->second.end());
}

BrokerResult ResourceTable::publishExport(ResourceId id, ManagedDescriptor descriptor,
                                          uint32_t handleType, ExportedHandle* outHandle) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    Entry& entry = it->second;
    if (entry.info.exported) {
        *outHandle = entry.info.exportHandle;
        return BrokerResult::kOk;
    }
    auto rawDescriptor = descriptor.get();
    if (!rawDescriptor) {
        ERR("Export of resource %u produced no descriptor.", id);
        return BrokerResult::kBackendFailure;
    }
    entry.info.exported = true;
    entry.info.exportHandle = ExportedHandle{.osHandle = static_cast<int64_t>(*rawDescriptor),
                                             .handleType = handleType};
    entry.canonicalExport.emplace(std::move(descriptor));
    *outHandle = entry.info.exportHandle;
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::duplicateExport(ResourceId id, ManagedDescriptor* outDescriptor,
                                            uint32_t* outHandleType) const {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end() || !it->second.canonicalExport) {
        return BrokerResult::kNotFound;
    }
    auto rawDescriptor = it->second.canonicalExport->get();
    if (!rawDescriptor) {
        return BrokerResult::kNotFound;
    }
    int duplicated = ::dup(*rawDescriptor);
    if (duplicated < 0) {
        ERR("dup() of the export handle of resource %u failed.", id);
        return BrokerResult::kBackendFailure;
    }
    *outDescriptor = ManagedDescriptor(duplicated);
    *outHandleType = it->second.info.exportHandle.handleType;
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::addScanoutRef(ResourceId id) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    ++it->second.info.scanoutRefs;
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::removeScanoutRef(ResourceId id) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    if (it->second.info.scanoutRefs == 0) {
        ERR("Resource %u has no scanout reference to drop.", id);
        GFXBROKER_REPORT_INVARIANT_VIOLATION(kNoContext, 0, "scanout reference underflow");
        return BrokerResult::kInvariantViolation;
    }
    --it->second.info.scanoutRefs;
    return BrokerResult::kOk;
}

BrokerResult ResourceTable::remove(ResourceId id,
                                   const std::function<bool(ResourceId)>& hasPendingFences,
                                   ResourceInfo* outRemoved) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    Entry& entry = it->second;
    if (entry.info.scanoutRefs > 0) {
        BROKER_DEBUG_LOG("resource %u is still bound to %u scanout(s)", id, entry.info.scanoutRefs);
        return BrokerResult::kInUse;
    }
    if (hasPendingFences && hasPendingFences(id)) {
        BROKER_DEBUG_LOG("resource %u is referenced by a pending fence", id);
        return BrokerResult::kInUse;
    }
    for (ContextId ctxId : entry.contexts) {
        auto ctxIt = mContextResources.find(ctxId);
        if (ctxIt == mContextResources.end()) {
            continue;
        }
        ctxIt->second.erase(id);
        if (ctxIt->second.empty()) {
            mContextResources.erase(ctxIt);
        }
    }
    if (outRemoved) {
        *outRemoved = snapshotLocked(entry);
    }
    mResources.erase(it);
    return BrokerResult::kOk;
}

size_t ResourceTable::size() const {
    AutoLock lock(mLock);
    return mResources.size();
}

}  // namespace gfxbroker
