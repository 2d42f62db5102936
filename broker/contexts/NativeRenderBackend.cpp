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

#include "NativeRenderBackend.h"

#include <utility>

#include "host-common/BrokerFatalError.h"
#include "host-common/logging.h"

namespace gfxbroker {

BrokerResult brokerResultFromVkResult(VkResult result) {
    switch (result) {
        case VK_SUCCESS:
            return BrokerResult::kOk;
        case VK_ERROR_FORMAT_NOT_SUPPORTED:
        case VK_ERROR_FEATURE_NOT_PRESENT:
        case VK_ERROR_EXTENSION_NOT_PRESENT:
            return BrokerResult::kUnsupported;
        default:
            ERR("Native renderer failed with VkResult %d.", static_cast<int>(result));
            return BrokerResult::kBackendFailure;
    }
}

namespace {

class NativeRenderContext : public BackendContext {
   public:
    NativeRenderContext(NativeRenderer* renderer, BackendHost* host, ContextId ctxId)
        : mRenderer(renderer), mHost(host), mCtxId(ctxId) {}

    ~NativeRenderContext() override { mRenderer->destroyContext(mCtxId); }

    ComponentType componentType() const override { return ComponentType::kNativeRender; }

    BrokerResult submit(const CommandBuffer& commands, const Fence& fence,
                        base::AsyncResult* outResult) override {
        const auto* ring = std::get_if<FenceRingContextSpecific>(&fence.ring);
        if (!ring || ring->ctxId != mCtxId) {
            ERR("Submit on context %u with a fence on %s.", mCtxId, to_string(fence.ring).c_str());
            return BrokerResult::kInvalidArgument;
        }
        BrokerResult result = brokerResultFromVkResult(
            mRenderer->submitCommands(mCtxId, commands.data, commands.size));
        if (result != BrokerResult::kOk) {
            return result;
        }
        mRenderer->asyncWaitForGpu(
            mCtxId, ring->ringIdx, [host = mHost, fenceRing = fence.ring, fenceId = fence.id] {
                BrokerResult signalResult = host->signalFence(fenceRing, fenceId);
                if (signalResult != BrokerResult::kOk) {
                    ERR("Completion of fence %llu rejected: %s",
                        static_cast<unsigned long long>(fenceId), toString(signalResult));
                }
            });
        *outResult = base::AsyncResult::OK_AND_CALLBACK_SCHEDULED;
        return BrokerResult::kOk;
    }

    BrokerResult createBlob(ResourceId id, const BlobCreateArgs& args,
                            BackendResource* outResource) override {
        NativeBlob blob;
        BrokerResult result = brokerResultFromVkResult(mRenderer->createBlob(id, args, {}, &blob));
        if (result != BrokerResult::kOk) {
            return result;
        }
        outResource->size = blob.size;
        outResource->mapInfo = blob.mapInfo;
        outResource->mapping = ResourceMapping{.hva = blob.hva, .size = blob.size};
        return BrokerResult::kOk;
    }

    BrokerResult attachResource(const ContextResource& resource) override {
        return brokerResultFromVkResult(mRenderer->attachResource(mCtxId, resource.id));
    }

    void detachResource(ResourceId id) override { mRenderer->detachResource(mCtxId, id); }

   private:
    NativeRenderer* const mRenderer;
    BackendHost* const mHost;
    const ContextId mCtxId;
};

}  // namespace

NativeRenderBackend::NativeRenderBackend(std::unique_ptr<NativeRenderer> renderer)
    : mRenderer(std::move(renderer)) {
    if (!mRenderer) {
        GFXBROKER_ABORT(FatalError(ABORT_REASON_MISCONFIGURED))
            << "native render component created without a renderer";
    }
}

NativeRenderBackend::~NativeRenderBackend() { mRenderer->finish(); }

std::vector<CapsetDescriptor> NativeRenderBackend::capsets() const {
    return mRenderer->capsets();
}

BrokerResult NativeRenderBackend::initialize(BackendHost* host) {
    mHost = host;
    return BrokerResult::kOk;
}

BrokerResult NativeRenderBackend::createContext(ContextId ctxId, uint32_t capsetId,
                                                const std::string& name,
                                                std::unique_ptr<BackendContext>* outContext) {
    BrokerResult result =
        brokerResultFromVkResult(mRenderer->createContext(ctxId, capsetId, name));
    if (result != BrokerResult::kOk) {
        return result;
    }
    *outContext = std::make_unique<NativeRenderContext>(mRenderer.get(), mHost, ctxId);
    return BrokerResult::kOk;
}

BrokerResult NativeRenderBackend::createResource(ResourceId id, const ResourceCreateArgs& args,
                                                 BackendResource* outResource) {
    uint64_t size = 0;
    BrokerResult result = brokerResultFromVkResult(mRenderer->createResource(id, args, &size));
    if (result != BrokerResult::kOk) {
        return result;
    }
    outResource->size = size;
    return BrokerResult::kOk;
}

BrokerResult NativeRenderBackend::createBlob(ResourceId id, const BlobCreateArgs& args,
                                             const IovecList& iovecs,
                                             BackendResource* outResource) {
    NativeBlob blob;
    BrokerResult result =
        brokerResultFromVkResult(mRenderer->createBlob(id, args, iovecs, &blob));
    if (result != BrokerResult::kOk) {
        return result;
    }
    outResource->size = blob.size ? blob.size : args.size;
    outResource->mapInfo = blob.mapInfo;
    outResource->mapping = ResourceMapping{.hva = blob.hva, .size = blob.size};
    return BrokerResult::kOk;
}

BrokerResult NativeRenderBackend::attachBacking(ResourceId id, const IovecList& iovecs) {
    return brokerResultFromVkResult(mRenderer->attachBacking(id, iovecs));
}

void NativeRenderBackend::detachBacking(ResourceId id) { mRenderer->detachBacking(id); }

BrokerResult NativeRenderBackend::transferToHost(ContextId ctxId, ResourceId id,
                                                 const TransferBox& box) {
    return brokerResultFromVkResult(mRenderer->transferWrite(ctxId, id, box));
}

BrokerResult NativeRenderBackend::transferFromHost(ContextId ctxId, ResourceId id,
                                                   const TransferBox& box, const IovecList* dst) {
    return brokerResultFromVkResult(mRenderer->transferRead(ctxId, id, box, dst));
}

BrokerResult NativeRenderBackend::exportResource(ResourceId id,
                                                 ExportedDescriptor* outDescriptor) {
    int fd = -1;
    uint32_t handleType = 0;
    BrokerResult result = brokerResultFromVkResult(mRenderer->exportBlob(id, &fd, &handleType));
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (fd < 0) {
        ERR("Native renderer exported resource %u without a descriptor.", id);
        return BrokerResult::kBackendFailure;
    }
    outDescriptor->descriptor = android::base::ManagedDescriptor(fd);
    outDescriptor->handleType = handleType;
    return BrokerResult::kOk;
}

BrokerResult NativeRenderBackend::unmapResource(ResourceId id) {
    return brokerResultFromVkResult(mRenderer->unmapBlob(id));
}

// Ring callbacks run in submission order, so a sync file for everything submitted so far also
// covers fenceId. It may signal later than fenceId itself when newer work is queued.
BrokerResult NativeRenderBackend::exportFence(ContextId ctxId, uint8_t ringIdx, FenceId fenceId,
                                              ExportedDescriptor* outDescriptor) {
    int fd = -1;
    BrokerResult result = brokerResultFromVkResult(mRenderer->exportSyncFd(ctxId, ringIdx, &fd));
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (fd < 0) {
        ERR("Native renderer exported fence %llu without a descriptor.",
            static_cast<unsigned long long>(fenceId));
        return BrokerResult::kBackendFailure;
    }
    outDescriptor->descriptor = android::base::ManagedDescriptor(fd);
    outDescriptor->handleType = kFenceHandleTypeSyncFd;
    return BrokerResult::kOk;
}

void NativeRenderBackend::destroyResource(ResourceId id) { mRenderer->destroyResource(id); }

}  // namespace gfxbroker
