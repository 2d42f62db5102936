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

#include "Broker.h"

#include <limits>
#include <optional>
#include <utility>

#include "VirtioGpuFormats.h"
#include "contexts/TransferUtils.h"
#include "host-common/logging.h"

namespace gfxbroker {

using android::base::AutoLock;
using android::base::ManagedDescriptor;

namespace {

constexpr uint32_t kResourceStrideAlignment = 16;

// Row pitch the guest should assume for a classic resource. Empty when it does not fit in the
// 32-bit stride field.
std::optional<uint32_t> resourceStride(const ResourceCreateArgs& args) {
    auto bpp = virgl_format_bpp(args.format);
    const uint64_t stride = align_up_64(static_cast<uint64_t>(args.width) * bpp.value_or(4),
                                        kResourceStrideAlignment);
    if (stride > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(stride);
}

}  // namespace

Broker::Broker(BrokerConfig config)
    : mConfig(std::move(config)),
      mNotifier(mConfig.fenceCallback ? std::make_unique<FenceNotifier>(mConfig.fenceCallback)
                                      : nullptr),
      mFences([this](const FenceCompletion& completion) {
          if (mNotifier) {
              mNotifier->notify(completion);
          }
      }),
      mScanouts(mConfig.numScanouts),
      mDispatcher(&mCapsets, mConfig.capsetMask) {
    for (uint32_t i = 0; i < mScanouts.size(); ++i) {
        mScanouts[i].scanoutId = i;
    }
}

Broker::~Broker() {
    mDispatcher.destroyAllContexts();
    if (mNotifier) {
        mNotifier->waitForPendingNotifications();
    }
}

uint32_t Broker::getCapsetCount() const { return mCapsets.count(mConfig.capsetMask); }

BrokerResult Broker::getCapsetInfo(uint32_t index, CapsetInfo* outInfo) const {
    return mCapsets.getInfo(index, mConfig.capsetMask, outInfo);
}

BrokerResult Broker::getCapset(uint32_t capsetId, uint32_t version,
                               std::vector<uint8_t>* outData) const {
    CapsetDescriptor capset;
    ComponentType component;
    BrokerResult result = mCapsets.find(capsetId, mConfig.capsetMask, &capset, &component);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (version > capset.version) {
        return BrokerResult::kUnsupported;
    }
    *outData = std::move(capset.data);
    return BrokerResult::kOk;
}

BrokerResult Broker::createContext(uint32_t capsetId, uint32_t capsetVersion,
                                   std::optional<ComponentType> hint, const std::string& name,
                                   ContextId* outId) {
    BrokerResult result = mDispatcher.createContext(capsetId, capsetVersion, hint, name, outId);
    if (result == BrokerResult::kOk && mConfig.verbose) {
        INFO("context %u created for capset %u (%s)", *outId, capsetId, name.c_str());
    }
    return result;
}

BrokerResult Broker::destroyContext(ContextId ctxId, ContextDestroyMode mode) {
    if (!mDispatcher.contains(ctxId)) {
        return BrokerResult::kNotFound;
    }
    if (mFences.hasPendingForContext(ctxId)) {
        if (mode == ContextDestroyMode::kRequireIdle) {
            return BrokerResult::kInUse;
        }
        size_t abandoned = mFences.abandonContext(ctxId);
        INFO("context %u destroyed with %zu fences outstanding", ctxId, abandoned);
    }

    for (ResourceId id : mResources.detachAllFromContext(ctxId)) {
        BrokerResult result = mDispatcher.detachResource(ctxId, id);
        if (result != BrokerResult::kOk) {
            ERR("Failed to detach resource %u from context %u: %s", id, ctxId,
                toString(result));
        }
    }
    BrokerResult result = mDispatcher.destroyContext(ctxId);
    if (result == BrokerResult::kOk && mConfig.verbose) {
        INFO("context %u destroyed", ctxId);
    }
    return result;
}

BrokerResult Broker::finishFence(const Fence& fence, BrokerResult backendResult) {
    if (backendResult != BrokerResult::kOk) {
        mFences.discard(fence.id);
        return backendResult;
    }
    return mFences.signal(fence.ring, fence.id);
}

BrokerResult Broker::submit(ContextId ctxId, const CommandBuffer& commands, uint8_t ringIdx,
                            Fence* outFence) {
    if (!mDispatcher.contains(ctxId)) {
        return BrokerResult::kNotFound;
    }
    const FenceRing ring = FenceRingContextSpecific{.ctxId = ctxId, .ringIdx = ringIdx};
    Fence fence = mFences.registerPending(ring, mResources.resourcesAttachedTo(ctxId));

    base::AsyncResult asyncResult;
    BrokerResult result = mDispatcher.submit(ctxId, commands, fence, &asyncResult);
    if (result == BrokerResult::kOk && !asyncResult.Succeeded()) {
        result = BrokerResult::kBackendFailure;
    }
    if (result != BrokerResult::kOk) {
        mFences.discard(fence.id);
        return result;
    }
    if (asyncResult.Value() == base::AsyncResult::OK_AND_CALLBACK_NOT_SCHEDULED) {
        result = mFences.signal(ring, fence.id);
        if (result != BrokerResult::kOk) {
            return result;
        }
    }
    *outFence = fence;
    return BrokerResult::kOk;
}

ContextBackend* Broker::backendForResource(const ResourceInfo& info) const {
    return mDispatcher.backendFor(info.component);
}

BrokerResult Broker::createResource(const ResourceCreateArgs& args, ResourceId* outId) {
    ComponentType component = mConfig.defaultComponent;
    if (args.ctxId != kNoContext) {
        ContextInfo context;
        if (mDispatcher.getContextInfo(args.ctxId, &context) != BrokerResult::kOk) {
            return BrokerResult::kNotFound;
        }
        component = context.component;
    }
    if (args.width == 0 || args.height == 0) {
        return BrokerResult::kInvalidArgument;
    }
    const std::optional<uint32_t> stride = resourceStride(args);
    if (!stride) {
        ERR("Resource width %u is too wide for format %u.", args.width, args.format);
        return BrokerResult::kInvalidArgument;
    }
    ContextBackend* backend = mDispatcher.backendFor(component);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }

    ResourceId id;
    BrokerResult result = mResources.allocateId(&id);
    if (result != BrokerResult::kOk) {
        return result;
    }
    BackendResource created;
    result = backend->createResource(id, args, &created);
    if (result != BrokerResult::kOk) {
        return result;
    }

    ResourceInfo info;
    info.id = id;
    info.component = component;
    info.componentMask = componentBit(component);
    info.ownerCtx = args.ctxId;
    info.args = args;
    info.size = created.size;
    info.stride = *stride;
    info.mapInfo = created.mapInfo;
    result = mResources.insert(info, {}, created.mapping);
    if (result != BrokerResult::kOk) {
        backend->destroyResource(id);
        return result;
    }
    if (mConfig.verbose) {
        INFO("resource %u created by %s: %ux%u format %u", id, toString(component), args.width,
             args.height, args.format);
    }
    *outId = id;
    return BrokerResult::kOk;
}

BrokerResult Broker::createBlob(const BlobCreateArgs& args, IovecList iovecs,
                                ResourceId* outId) {
    ComponentType component = mConfig.defaultComponent;
    if (args.ctxId != kNoContext) {
        ContextInfo context;
        if (mDispatcher.getContextInfo(args.ctxId, &context) != BrokerResult::kOk) {
            return BrokerResult::kNotFound;
        }
        component = context.component;
    }
    if (args.size == 0 || args.blobMem < kBlobMemGuest || args.blobMem > kBlobMemHost3dGuest) {
        return BrokerResult::kInvalidArgument;
    }
    const bool guestBacked = args.blobMem != kBlobMemHost3d;
    if (guestBacked && iovecsTotalSize(iovecs) < args.size) {
        ERR("Blob of %llu bytes has only %zu bytes of guest backing.",
            static_cast<unsigned long long>(args.size), iovecsTotalSize(iovecs));
        return BrokerResult::kInvalidArgument;
    }
    if (!guestBacked) {
        iovecs.clear();
    }
    ContextBackend* backend = mDispatcher.backendFor(component);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }

    ResourceId id;
    BrokerResult result = mResources.allocateId(&id);
    if (result != BrokerResult::kOk) {
        return result;
    }
    BackendResource created;
    if (args.blobId != 0 && args.ctxId != kNoContext) {
        result = mDispatcher.createContextBlob(args.ctxId, id, args, &created);
    } else {
        result = backend->createBlob(id, args, iovecs, &created);
    }
    if (result != BrokerResult::kOk) {
        return result;
    }

    ResourceInfo info;
    info.id = id;
    info.component = component;
    info.componentMask = componentBit(component);
    info.ownerCtx = args.ctxId;
    info.isBlob = true;
    info.blobArgs = args;
    info.size = created.size ? created.size : args.size;
    info.mapInfo = created.mapInfo;
    result = mResources.insert(info, std::move(iovecs), created.mapping);
    if (result != BrokerResult::kOk) {
        backend->destroyResource(id);
        return result;
    }
    if (mConfig.verbose) {
        INFO("blob %u created by %s: mem %u flags 0x%x size %llu", id, toString(component),
             args.blobMem, args.blobFlags, static_cast<unsigned long long>(info.size));
    }
    *outId = id;
    return BrokerResult::kOk;
}

BrokerResult Broker::destroyResource(ResourceId id) {
    ResourceInfo removed;
    BrokerResult result = mResources.remove(
        id, [this](ResourceId resId) { return mFences.hasPendingReferences(resId); }, &removed);
    if (result != BrokerResult::kOk) {
        return result;
    }
    for (ContextId ctxId : removed.attachedContexts) {
        result = mDispatcher.detachResource(ctxId, id);
        if (result != BrokerResult::kOk) {
            ERR("Failed to detach resource %u from context %u: %s", id, ctxId,
                toString(result));
        }
    }
    if (ContextBackend* backend = backendForResource(removed)) {
        backend->destroyResource(id);
    }
    if (mConfig.verbose) {
        INFO("resource %u destroyed", id);
    }
    return BrokerResult::kOk;
}

BrokerResult Broker::getResourceInfo(ResourceId id, ResourceInfo* outInfo) const {
    return mResources.lookup(id, outInfo);
}

BrokerResult Broker::attachBacking(ResourceId id, IovecList iovecs) {
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    result = mResources.attachBacking(id, iovecs);
    if (result != BrokerResult::kOk) {
        return result;
    }
    ContextBackend* backend = backendForResource(info);
    result = backend ? backend->attachBacking(id, iovecs) : BrokerResult::kUnsupported;
    if (result != BrokerResult::kOk) {
        BrokerResult rollback = mResources.detachBacking(id);
        if (rollback != BrokerResult::kOk) {
            ERR("Failed to roll back backing of resource %u: %s", id, toString(rollback));
        }
    }
    return result;
}

BrokerResult Broker::detachBacking(ResourceId id) {
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    result = mResources.detachBacking(id);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (ContextBackend* backend = backendForResource(info)) {
        backend->detachBacking(id);
    }
    return BrokerResult::kOk;
}

BrokerResult Broker::attachResource(ContextId ctxId, ResourceId id) {
    if (!mDispatcher.contains(ctxId)) {
        return BrokerResult::kNotFound;
    }
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    result = mResources.attachToContext(id, ctxId);
    if (result != BrokerResult::kOk) {
        return result;
    }

    ContextResource resource;
    resource.id = id;
    resource.blobMem = info.isBlob ? info.blobArgs.blobMem : 0;
    if (info.backing == BackingKind::kGuestIovecs) {
        result = mResources.getBacking(id, &resource.iovecs);
    }
    if (result == BrokerResult::kOk && info.cpuMappable()) {
        result = mResources.getMapping(id, &resource.mapping);
    }
    if (result == BrokerResult::kOk) {
        result = mDispatcher.attachResource(ctxId, resource);
    }
    if (result != BrokerResult::kOk) {
        BrokerResult rollback = mResources.detachFromContext(id, ctxId);
        if (rollback != BrokerResult::kOk) {
            ERR("Failed to roll back attach of resource %u: %s", id, toString(rollback));
        }
    }
    return result;
}

BrokerResult Broker::detachResource(ContextId ctxId, ResourceId id) {
    if (!mDispatcher.contains(ctxId)) {
        return BrokerResult::kNotFound;
    }
    BrokerResult result = mResources.detachFromContext(id, ctxId);
    if (result != BrokerResult::kOk) {
        return result;
    }
    return mDispatcher.detachResource(ctxId, id);
}

BrokerResult Broker::transferToHost(ContextId ctxId, ResourceId id, const TransferBox& box,
                                    Fence* outFence) {
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (ctxId != kNoContext && !mDispatcher.contains(ctxId)) {
        return BrokerResult::kNotFound;
    }
    ContextBackend* backend = backendForResource(info);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }

    const FenceRing ring = ctxId == kNoContext
                               ? FenceRing(FenceRingGlobal{})
                               : FenceRing(FenceRingContextSpecific{.ctxId = ctxId, .ringIdx = 0});
    result = validateTransfer(info, box, nullptr);
    if (result != BrokerResult::kOk) {
        return result;
    }
    Fence fence = mFences.registerPending(ring, {id});
    result = finishFence(fence, backend->transferToHost(ctxId, id, box));
    if (result != BrokerResult::kOk) {
        return result;
    }
    *outFence = fence;
    return BrokerResult::kOk;
}

BrokerResult Broker::transferFromHost(ContextId ctxId, ResourceId id, const TransferBox& box,
                                      const IovecList* dst, Fence* outFence) {
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (ctxId != kNoContext && !mDispatcher.contains(ctxId)) {
        return BrokerResult::kNotFound;
    }
    ContextBackend* backend = backendForResource(info);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }

    const FenceRing ring = ctxId == kNoContext
                               ? FenceRing(FenceRingGlobal{})
                               : FenceRing(FenceRingContextSpecific{.ctxId = ctxId, .ringIdx = 0});
    result = validateTransfer(info, box, dst);
    if (result != BrokerResult::kOk) {
        return result;
    }
    Fence fence = mFences.registerPending(ring, {id});
    result = finishFence(fence, backend->transferFromHost(ctxId, id, box, dst));
    if (result != BrokerResult::kOk) {
        return result;
    }
    *outFence = fence;
    return BrokerResult::kOk;
}

BrokerResult Broker::validateTransfer(const ResourceInfo& info, const TransferBox& box,
                                      const IovecList* dst) const {
    if (info.isBlob || box.isEmpty()) {
        return BrokerResult::kOk;
    }
    const ResourceCreateArgs& args = info.args;
    if (static_cast<uint64_t>(box.x) + box.w > args.width ||
        static_cast<uint64_t>(box.y) + box.h > args.height) {
        ERR("Transfer box %ux%u at (%u, %u) exceeds resource %u (%ux%u).", box.w, box.h, box.x,
            box.y, info.id, args.width, args.height);
        return BrokerResult::kInvalidArgument;
    }
    // Explicit guest strides and formats outside the table are measured by the backend.
    if (box.stride != 0) {
        return BrokerResult::kOk;
    }
    auto length =
        virgl_format_to_total_xfer_len(args.format, args.width, args.height, box.w, box.h);
    if (!length) {
        return BrokerResult::kOk;
    }

    size_t available = 0;
    if (dst) {
        available = iovecsTotalSize(*dst);
    } else if (info.backing == BackingKind::kGuestIovecs) {
        IovecList backing;
        BrokerResult result = mResources.getBacking(info.id, &backing);
        if (result != BrokerResult::kOk) {
            return result;
        }
        available = iovecsTotalSize(backing);
    } else {
        return BrokerResult::kOk;
    }
    if (box.offset > available || *length > available - box.offset) {
        ERR("Transfer of %zu bytes at offset %llu overflows %zu bytes of guest memory for "
            "resource %u.",
            *length, static_cast<unsigned long long>(box.offset), available, info.id);
        return BrokerResult::kInvalidArgument;
    }
    return BrokerResult::kOk;
}

BrokerResult Broker::exportResource(ResourceId id, ExportedHandle* outHandle) {
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (info.exported) {
        *outHandle = info.exportHandle;
        return BrokerResult::kOk;
    }
    ContextBackend* backend = backendForResource(info);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }
    ExportedDescriptor exported;
    result = backend->exportResource(id, &exported);
    if (result != BrokerResult::kOk) {
        return result;
    }
    return mResources.publishExport(id, std::move(exported.descriptor), exported.handleType,
                                    outHandle);
}

BrokerResult Broker::exportResourceDuplicate(ResourceId id, ManagedDescriptor* outDescriptor,
                                             uint32_t* outHandleType) {
    ExportedHandle handle;
    BrokerResult result = exportResource(id, &handle);
    if (result != BrokerResult::kOk) {
        return result;
    }
    return mResources.duplicateExport(id, outDescriptor, outHandleType);
}

BrokerResult Broker::mapResource(ResourceId id, ResourceMapping* outMapping) const {
    return mResources.getMapping(id, outMapping);
}

BrokerResult Broker::unmapResource(ResourceId id) {
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (!info.cpuMappable()) {
        return BrokerResult::kUnsupported;
    }
    if (info.scanoutRefs > 0) {
        ERR("Resource %u is scanned out and cannot be unmapped.", id);
        return BrokerResult::kInUse;
    }
    ContextBackend* backend = backendForResource(info);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }
    result = backend->unmapResource(id);
    if (result != BrokerResult::kOk) {
        return result;
    }
    return mResources.clearMapping(id);
}

BrokerResult Broker::getMapInfo(ResourceId id, uint32_t* outMapInfo) const {
    ResourceInfo info;
    BrokerResult result = mResources.lookup(id, &info);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (!info.cpuMappable()) {
        return BrokerResult::kUnsupported;
    }
    *outMapInfo = info.mapInfo;
    return BrokerResult::kOk;
}

BrokerResult Broker::validateScanout(const ScanoutInfo& scanout, const ResourceInfo& resource,
                                     ScanoutInfo* outNormalized) const {
    if (scanout.width == 0 || scanout.height == 0) {
        return BrokerResult::kInvalidArgument;
    }
    ScanoutInfo normalized = scanout;

    if (resource.isBlob) {
        auto bpp = virgl_format_bpp(scanout.format);
        if (!bpp) {
            ERR("Scanout %u: format %u cannot be scanned out.", scanout.scanoutId,
                scanout.format);
            return BrokerResult::kInvalidArgument;
        }
        const uint64_t rowEnd = (static_cast<uint64_t>(scanout.x) + scanout.width) * *bpp;
        if (scanout.stride < rowEnd) {
            ERR("Scanout %u: stride %u is shorter than a %llu byte row.", scanout.scanoutId,
                scanout.stride, static_cast<unsigned long long>(rowEnd));
            return BrokerResult::kInvalidArgument;
        }
        if (scanout.offset > resource.size) {
            ERR("Scanout %u: offset %llu is outside blob %u.", scanout.scanoutId,
                static_cast<unsigned long long>(scanout.offset), resource.id);
            return BrokerResult::kInvalidArgument;
        }
        const uint64_t end =
            scanout.offset +
            static_cast<uint64_t>(scanout.stride) * (static_cast<uint64_t>(scanout.y) +
                                                     scanout.height - 1) +
            rowEnd;
        if (end > resource.size) {
            ERR("Scanout %u: %llu bytes needed, blob %u has %llu.", scanout.scanoutId,
                static_cast<unsigned long long>(end), resource.id,
                static_cast<unsigned long long>(resource.size));
            return BrokerResult::kInvalidArgument;
        }
    } else {
        // Strides follow the resource's own format. A different scanout format is only a
        // reinterpretation of the same pixels and must keep the pixel size.
        auto bpp = virgl_format_bpp(resource.args.format);
        if (!bpp) {
            ERR("Scanout %u: resource %u has format %u, which cannot be scanned out.",
                scanout.scanoutId, resource.id, resource.args.format);
            return BrokerResult::kInvalidArgument;
        }
        if (scanout.format == 0) {
            normalized.format = resource.args.format;
        } else if (scanout.format != resource.args.format) {
            auto requested = virgl_format_bpp(scanout.format);
            if (!requested || *requested != *bpp) {
                ERR("Scanout %u: format %u does not match resource %u format %u.",
                    scanout.scanoutId, scanout.format, resource.id, resource.args.format);
                return BrokerResult::kInvalidArgument;
            }
        }
        const uint64_t packed = static_cast<uint64_t>(resource.args.width) * *bpp;
        const uint64_t aligned = align_up_64(packed, kResourceStrideAlignment);
        if (scanout.stride == 0) {
            normalized.stride = static_cast<uint32_t>(packed);
        } else if (scanout.stride != packed && scanout.stride != aligned) {
            ERR("Scanout %u: stride %u does not match resource %u (%llu or %llu).",
                scanout.scanoutId, scanout.stride, resource.id,
                static_cast<unsigned long long>(packed), static_cast<unsigned long long>(aligned));
            return BrokerResult::kInvalidArgument;
        }
        if (static_cast<uint64_t>(scanout.x) + scanout.width > resource.args.width ||
            static_cast<uint64_t>(scanout.y) + scanout.height > resource.args.height) {
            ERR("Scanout %u: rectangle exceeds resource %u.", scanout.scanoutId, resource.id);
            return BrokerResult::kInvalidArgument;
        }
    }
    *outNormalized = normalized;
    return BrokerResult::kOk;
}

BrokerResult Broker::setScanout(const ScanoutInfo& scanout) {
    if (scanout.scanoutId >= mConfig.numScanouts) {
        return BrokerResult::kOutOfRange;
    }

    ScanoutInfo normalized{.scanoutId = scanout.scanoutId};
    ResourceInfo resource;
    if (scanout.resourceId != kInvalidResourceId) {
        BrokerResult result = mResources.lookup(scanout.resourceId, &resource);
        if (result != BrokerResult::kOk) {
            return result;
        }
        result = validateScanout(scanout, resource, &normalized);
        if (result != BrokerResult::kOk) {
            return result;
        }
    }

    {
        AutoLock lock(mScanoutLock);
        ScanoutInfo& current = mScanouts[scanout.scanoutId];
        const ResourceId previous = current.resourceId;
        if (normalized.resourceId != previous) {
            if (normalized.resourceId != kInvalidResourceId) {
                BrokerResult result = mResources.addScanoutRef(normalized.resourceId);
                if (result != BrokerResult::kOk) {
                    return result;
                }
            }
            if (previous != kInvalidResourceId) {
                BrokerResult result = mResources.removeScanoutRef(previous);
                if (result != BrokerResult::kOk) {
                    ERR("Scanout %u lost its reference on resource %u: %s", scanout.scanoutId,
                        previous, toString(result));
                }
            }
        }
        current = normalized;
    }

    if (mConfig.verbose) {
        INFO("scanout %u -> resource %u (%ux%u stride %u)", scanout.scanoutId,
             normalized.resourceId, normalized.width, normalized.height, normalized.stride);
    }
    if (normalized.resourceId != kInvalidResourceId) {
        if (ContextBackend* backend = backendForResource(resource)) {
            backend->onScanoutBound(normalized.resourceId, normalized);
        }
    }
    return BrokerResult::kOk;
}

BrokerResult Broker::getScanout(uint32_t scanoutId, ScanoutInfo* outScanout) const {
    if (scanoutId >= mConfig.numScanouts) {
        return BrokerResult::kOutOfRange;
    }
    AutoLock lock(mScanoutLock);
    *outScanout = mScanouts[scanoutId];
    return BrokerResult::kOk;
}

Fence Broker::createGlobalFence() {
    Fence fence = mFences.registerPending(FenceRingGlobal{});
    BrokerResult result = mFences.signal(fence.ring, fence.id);
    if (result != BrokerResult::kOk) {
        ERR("Global fence %llu could not be signaled: %s",
            static_cast<unsigned long long>(fence.id), toString(result));
    }
    return fence;
}

BrokerResult Broker::pollFence(FenceId id, FenceState* outState) const {
    return mFences.poll(id, outState);
}

BrokerResult Broker::waitFence(FenceId id, uint64_t timeoutUs, FenceState* outState) {
    return mFences.wait(id, timeoutUs, outState);
}

void Broker::markFencesObserved(FenceId upTo) { mFences.markObserved(upTo); }

BrokerResult Broker::exportFence(FenceId id, ManagedDescriptor* outDescriptor,
                                 uint32_t* outHandleType) {
    FenceRing ring;
    BrokerResult result = mFences.ringOf(id, &ring);
    if (result != BrokerResult::kOk) {
        return result;
    }
    const auto* contextRing = std::get_if<FenceRingContextSpecific>(&ring);
    if (!contextRing) {
        return BrokerResult::kUnsupported;
    }
    ContextInfo context;
    result = mDispatcher.getContextInfo(contextRing->ctxId, &context);
    if (result != BrokerResult::kOk) {
        return result;
    }
    ContextBackend* backend = mDispatcher.backendFor(context.component);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }
    ExportedDescriptor exported;
    result = backend->exportFence(contextRing->ctxId, contextRing->ringIdx, id, &exported);
    if (result != BrokerResult::kOk) {
        return result;
    }
    *outDescriptor = std::move(exported.descriptor);
    *outHandleType = exported.handleType;
    return BrokerResult::kOk;
}

void Broker::waitForPendingFenceNotifications() {
    if (mNotifier) {
        mNotifier->waitForPendingNotifications();
    }
}

BrokerResult Broker::signalFence(const FenceRing& ring, FenceId id) {
    return mFences.signal(ring, id);
}

BrokerResult Broker::lookupResource(ResourceId id, ResourceInfo* outInfo) const {
    return mResources.lookup(id, outInfo);
}

BrokerResult Broker::duplicateResourceHandle(ResourceId id, ManagedDescriptor* outDescriptor,
                                             uint32_t* outHandleType) {
    return exportResourceDuplicate(id, outDescriptor, outHandleType);
}

}  // namespace gfxbroker
