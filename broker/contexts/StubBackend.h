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

#include <set>
#include <unordered_map>

#include "ContextBackend.h"
#include "aemu/base/synchronization/Lock.h"

namespace gfxbroker {

// Vendor component that accepts every call and does no work. It keeps the vendor capset
// negotiable for guests that query it.
class StubBackend : public ContextBackend {
   public:
    StubBackend() = default;
    ~StubBackend() override = default;

    ComponentType componentType() const override { return ComponentType::kStub; }
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

    void destroyResource(ResourceId id) override;

   private:
    mutable android::base::Lock mLock;
    std::set<ResourceId> mResources;
};

}  // namespace gfxbroker
