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

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "BrokerTypes.h"

namespace gfxbroker {

// Host memory a renderer allocated for a blob.
struct NativeBlob {
    void* hva = nullptr;
    uint64_t size = 0;
    uint32_t mapInfo = 0;
};

// The GL/Vulkan passthrough renderer the embedder links in. Calls are made with no broker locks
// held. Completion callbacks may run on any renderer thread, each exactly once, and callbacks for
// one (context, ring) pair must run in the order they were requested.
class NativeRenderer {
   public:
    using CompletionCallback = std::function<void()>;

    virtual ~NativeRenderer() = default;

    virtual std::vector<CapsetDescriptor> capsets() const = 0;

    virtual VkResult createContext(ContextId ctxId, uint32_t capsetId, const std::string& name) = 0;
    virtual void destroyContext(ContextId ctxId) = 0;

    virtual VkResult createResource(ResourceId id, const ResourceCreateArgs& args,
                                    uint64_t* outSize) = 0;
    virtual VkResult createBlob(ResourceId id, const BlobCreateArgs& args, const IovecList& iovecs,
                                NativeBlob* outBlob) = 0;
    virtual void destroyResource(ResourceId id) = 0;

    virtual VkResult attachBacking(ResourceId id, const IovecList& iovecs) = 0;
    virtual void detachBacking(ResourceId id) = 0;

    virtual VkResult attachResource(ContextId ctxId, ResourceId id) = 0;
    virtual void detachResource(ContextId ctxId, ResourceId id) = 0;

    virtual VkResult transferWrite(ContextId ctxId, ResourceId id, const TransferBox& box) = 0;
    virtual VkResult transferRead(ContextId ctxId, ResourceId id, const TransferBox& box,
                                  const IovecList* dst) = 0;

    virtual VkResult submitCommands(ContextId ctxId, const uint8_t* data, size_t size) = 0;
    // Runs callback once all work submitted so far on the ring has finished on the GPU.
    virtual void asyncWaitForGpu(ContextId ctxId, uint8_t ringIdx, CompletionCallback callback) = 0;

    // The returned descriptor is owned by the caller.
    virtual VkResult exportBlob(ResourceId id, int* outFd, uint32_t* outHandleType) = 0;
    // Releases the host mapping handed out by createBlob. The blob itself stays alive.
    virtual VkResult unmapBlob(ResourceId id) = 0;
    // A sync file owned by the caller that signals once all work submitted so far on the ring
    // has finished on the GPU.
    virtual VkResult exportSyncFd(ContextId ctxId, uint8_t ringIdx, int* outFd) = 0;

    // Blocks until all outstanding callbacks have run.
    virtual void finish() = 0;
};

}  // namespace gfxbroker
