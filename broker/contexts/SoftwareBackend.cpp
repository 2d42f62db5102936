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

#include "SoftwareBackend.h"

#include <utility>

#include "TransferUtils.h"
#include "VirtioGpuFormats.h"
#include "host-common/logging.h"

namespace gfxbroker {

using android::base::AutoLock;

namespace {

constexpr uint32_t kBytesPerPixel = 4;

}  // namespace

BrokerResult SoftwareBackend::initialize(BackendHost* host) {
    mHost = host;
    return BrokerResult::kOk;
}

BrokerResult SoftwareBackend::createContext(ContextId, uint32_t capsetId, const std::string&,
                                            std::unique_ptr<BackendContext>*) {
    ERR("The 2D component has no contexts (capset %u requested).", capsetId);
    return BrokerResult::kUnsupported;
}

BrokerResult SoftwareBackend::createResource(ResourceId id, const ResourceCreateArgs& args,
                                             BackendResource* outResource) {
    if (args.target != kPipeTexture2D || args.depth != 1 || args.arraySize != 1 ||
        args.lastLevel != 0 || args.nrSamples > 1) {
        ERR("Unsupported 2D resource layout: target %u depth %u array %u levels %u samples %u",
            args.target, args.depth, args.arraySize, args.lastLevel, args.nrSamples);
        return BrokerResult::kUnsupported;
    }
    if (!virgl_format_is_2d_compatible(args.format)) {
        ERR("Format %u is not supported for 2D resources.", args.format);
        return BrokerResult::kUnsupported;
    }
    if (args.width == 0 || args.height == 0) {
        return BrokerResult::kInvalidArgument;
    }
    const uint64_t size = static_cast<uint64_t>(args.width) * kBytesPerPixel * args.height;
    if (size > kMaxResourceBytes) {
        ERR("2D resource of %ux%u exceeds the size limit.", args.width, args.height);
        return BrokerResult::kInvalidArgument;
    }

    Resource resource;
    resource.format = args.format;
    resource.width = args.width;
    resource.height = args.height;
    resource.size = size;
    resource.hostMem.resize(size);

    AutoLock lock(mLock);
    mResources[id] = std::move(resource);
    outResource->size = size;
    outResource->mapInfo = 0;
    outResource->mapping = ResourceMapping{};
    return BrokerResult::kOk;
}

BrokerResult SoftwareBackend::createBlob(ResourceId id, const BlobCreateArgs& args,
                                         const IovecList& iovecs, BackendResource* outResource) {
    if (args.blobMem != kBlobMemGuest) {
        ERR("The 2D component only supports guest blobs (blob mem %u).", args.blobMem);
        return BrokerResult::kUnsupported;
    }
    if (args.size == 0 || iovecsTotalSize(iovecs) < args.size) {
        ERR("Guest blob of %llu bytes is not covered by its iovecs.",
            static_cast<unsigned long long>(args.size));
        return BrokerResult::kInvalidArgument;
    }

    Resource resource;
    resource.isBlob = true;
    resource.size = args.size;
    resource.iovecs = iovecs;

    AutoLock lock(mLock);
    mResources[id] = std::move(resource);
    outResource->size = args.size;
    outResource->mapInfo = 0;
    outResource->mapping = ResourceMapping{};
    return BrokerResult::kOk;
}

BrokerResult SoftwareBackend::attachBacking(ResourceId id, const IovecList& iovecs) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    it->second.iovecs = iovecs;
    return BrokerResult::kOk;
}

void SoftwareBackend::detachBacking(ResourceId id) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it != mResources.end()) {
        it->second.iovecs.clear();
    }
}

BrokerResult SoftwareBackend::transferToHost(ContextId, ResourceId id, const TransferBox& box) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    Resource& resource = it->second;
    // Guest blobs have no host copy to update.
    if (resource.isBlob || box.isEmpty()) {
        return BrokerResult::kOk;
    }
    if (resource.iovecs.empty()) {
        ERR("Transfer to resource %u without backing.", id);
        return BrokerResult::kInvalidArgument;
    }
    Transfer2D xfer{.x = box.x,
                    .y = box.y,
                    .w = box.w,
                    .h = box.h,
                    .bpp = kBytesPerPixel,
                    .hostWidth = resource.width,
                    .hostHeight = resource.height,
                    .guestStride = box.stride,
                    .guestOffset = box.offset};
    return transfer2DToHost(xfer, resource.iovecs, resource.hostMem.data(),
                            resource.hostMem.size());
}

BrokerResult SoftwareBackend::transferFromHost(ContextId, ResourceId id, const TransferBox& box,
                                               const IovecList* dst) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return BrokerResult::kNotFound;
    }
    const Resource& resource = it->second;
    if (box.isEmpty()) {
        return BrokerResult::kOk;
    }
    if (resource.isBlob) {
        if (!dst) {
            return BrokerResult::kOk;
        }
        return readBackBlobLocked(resource, box, *dst);
    }
    const IovecList& target = dst ? *dst : resource.iovecs;
    if (target.empty()) {
        ERR("Transfer from resource %u without a destination.", id);
        return BrokerResult::kInvalidArgument;
    }
    Transfer2D xfer{.x = box.x,
                    .y = box.y,
                    .w = box.w,
                    .h = box.h,
                    .bpp = kBytesPerPixel,
                    .hostWidth = resource.width,
                    .hostHeight = resource.height,
                    .guestStride = box.stride,
                    .guestOffset = box.offset};
    return transfer2DFromHost(xfer, resource.hostMem.data(), resource.hostMem.size(), target);
}

BrokerResult SoftwareBackend::readBackBlobLocked(const Resource& resource, const TransferBox& box,
                                                 const IovecList& dst) const {
    if (resource.scanoutStride == 0) {
        ERR("Guest blob read back before its layout is known.");
        return BrokerResult::kInvalidArgument;
    }
    const uint64_t stride = resource.scanoutStride;
    const uint64_t rowBytes = static_cast<uint64_t>(box.w) * kBytesPerPixel;
    const uint64_t dstStride = box.stride ? box.stride : rowBytes;
    if (rowBytes > stride || rowBytes > dstStride) {
        return BrokerResult::kInvalidArgument;
    }
    const uint64_t lastRowStart = (static_cast<uint64_t>(box.y) + box.h - 1) * stride +
                                  static_cast<uint64_t>(box.x) * kBytesPerPixel;
    if (lastRowStart + rowBytes > resource.size) {
        ERR("Read back box overflows a %llu byte blob.",
            static_cast<unsigned long long>(resource.size));
        return BrokerResult::kInvalidArgument;
    }

    std::vector<uint8_t> row(rowBytes);
    for (uint32_t i = 0; i < box.h; ++i) {
        const uint64_t srcOffset = (static_cast<uint64_t>(box.y) + i) * stride +
                                   static_cast<uint64_t>(box.x) * kBytesPerPixel;
        if (!copyFromIovecs(resource.iovecs, srcOffset, row.data(), row.size()) ||
            !copyToIovecs(dst, box.offset + dstStride * i, row.data(), row.size())) {
            return BrokerResult::kInvalidArgument;
        }
    }
    return BrokerResult::kOk;
}

void SoftwareBackend::destroyResource(ResourceId id) {
    AutoLock lock(mLock);
    mResources.erase(id);
}

void SoftwareBackend::onScanoutBound(ResourceId id, const ScanoutInfo& scanout) {
    AutoLock lock(mLock);
    auto it = mResources.find(id);
    if (it == mResources.end()) {
        return;
    }
    if (it->second.isBlob) {
        it->second.scanoutStride = scanout.stride;
        it->second.format = scanout.format;
        it->second.width = scanout.width;
        it->second.height = scanout.height;
    }
}

}  // namespace gfxbroker
