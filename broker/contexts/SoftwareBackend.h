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
#include <unordered_map>
#include <vector>

#include "ContextBackend.h"
#include "aemu/base/synchronization/Lock.h"

namespace gfxbroker {

// Context-less 2D resources kept as a packed 4 bytes per pixel host shadow, plus guest-memory
// blobs used as scanout buffers. Has no capsets and therefore no contexts.
class SoftwareBackend : public ContextBackend {
   public:
    static constexpr uint64_t kMaxResourceBytes = 256ull * 1024 * 1024;

    SoftwareBackend() = default;
    ~SoftwareBackend() override = default;

    ComponentType componentType() const override { return ComponentType::k2D; }
    std::vector<CapsetDescriptor> capsets() const override { return {}; }

    BrokerResult initialize(BackendHost* host) override;

    BrokerResult createContext(ContextId ctxId, uint32_t capsetId, const std::string& name,
                               std::unique_ptr<BackendContext>* outContext) override;

    BrokerResult createResource(ResourceId id, const ResourceCreateArgs& args,
                                BackendResource* outResource) override;
    BrokerResult createBlob(ResourceId id, const BlobCreateArgs& args, const IovecList& iovecs,
                            BackendResource* outResource) override;

    BrokerResult attachBacking(ResourceId id, const IovecList& iovecs) override;
    void detachBacking(ResourceId id) override;

    BrokerResult transferToHost(ContextId ctxId, ResourceId id, const TransferBox& box) override;
    BrokerResult transferFromHost(ContextId ctxId, ResourceId id, const TransferBox& box,
                                  const IovecList* dst) override;

    void destroyResource(ResourceId id) override;

    void onScanoutBound(ResourceId id, const ScanoutInfo& scanout) override;

   private:
    struct Resource {
        bool isBlob = false;
        uint32_t format = 0;
        uint32_t width = 0;
        uint32_t height = 0;
        uint64_t size = 0;
        std::vector<uint8_t> hostMem;
        IovecList iovecs;
        // Row pitch of a guest blob, known once it is bound to a scanout.
        uint32_t scanoutStride = 0;
    };

    BrokerResult readBackBlobLocked(const Resource& resource, const TransferBox& box,
                                    const IovecList& dst) const;

    BackendHost* mHost = nullptr;
    mutable android::base::Lock mLock;
    std::unordered_map<ResourceId, Resource> mResources;
};

}  // namespace gfxbroker
