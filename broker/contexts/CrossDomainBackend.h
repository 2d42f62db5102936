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
#include <memory>
#include <string>
#include <unordered_map>

#include "ContextBackend.h"
#include "CrossDomainProtocol.h"
#include "aemu/base/ManagedDescriptor.hpp"
#include "aemu/base/memory/SharedMemory.h"
#include "aemu/base/synchronization/Lock.h"

namespace gfxbroker {

// Linear layout the cross-domain component hands out for an image. Exposed for testing.
BrokerResult computeLinearImageRequirements(uint32_t width, uint32_t height, uint32_t drmFormat,
                                            CrossDomainImageRequirements* outReqs);

// Opens the host end of a channel for a channel type the guest asked for in INIT.
using CrossDomainConnector = std::function<BrokerResult(
    uint32_t channelType, android::base::ManagedDescriptor* outChannel)>;

// Connects a SOCK_STREAM unix socket to the path registered for the channel type.
CrossDomainConnector unixSocketConnector(std::map<uint32_t, std::string> socketPaths);

// Buffer sharing with a host compositor. Guests negotiate image layouts over the query ring
// and then allocate shared-memory blobs for them by item id. With a connector, INIT also opens
// a channel: SEND and WRITE go out over it, and messages and pipe data coming back complete
// channel ring fences.
class CrossDomainBackend : public ContextBackend {
   public:
    explicit CrossDomainBackend(uint32_t supportedChannels = 1u << kCrossDomainChannelTypeWayland,
                                CrossDomainConnector connector = {});
    ~CrossDomainBackend() override;

    ComponentType componentType() const override { return ComponentType::kCrossDomain; }
    std::vector<CapsetDescriptor> capsets() const override;

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

    BrokerResult exportResource(ResourceId id, ExportedDescriptor* outDescriptor) override;

    void destroyResource(ResourceId id) override;

    // Called by contexts.
    BrokerResult connectChannel(uint32_t channelType, android::base::ManagedDescriptor* outChannel);
    // Backs an image-requirements item with shared memory.
    BrokerResult allocateSharedMemory(ResourceId id, uint64_t size, BackendResource* outResource);
    // Turns a descriptor received over the channel into a resource. It has no host mapping and
    // is handed out again on export.
    BrokerResult adoptDescriptor(ResourceId id, uint64_t size,
                                 android::base::ManagedDescriptor descriptor,
                                 BackendResource* outResource);

   private:
    struct Resource {
        uint64_t size = 0;
        std::unique_ptr<android::base::SharedMemory> sharedMemory;
        android::base::ManagedDescriptor descriptor;
    };

    const uint32_t mSupportedChannels;
    const CrossDomainConnector mConnector;
    BackendHost* mHost = nullptr;
    android::base::Lock mLock;
    std::unordered_map<ResourceId, Resource> mResources;
};

}  // namespace gfxbroker
