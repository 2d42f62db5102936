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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "BrokerTypes.h"
#include "CapsetRegistry.h"
#include "aemu/base/synchronization/Lock.h"
#include "base/AsyncResult.h"
#include "contexts/ContextBackend.h"

namespace gfxbroker {

struct ContextInfo {
    ContextId id = kNoContext;
    ComponentType component = ComponentType::k2D;
    uint32_t capsetId = 0;
    uint32_t capsetVersion = 0;
    std::string name;
};

// Routes per-context requests to the backend context chosen when the context was created. The
// association between a context id and its backend never changes.
class ContextDispatcher {
   public:
    ContextDispatcher(const CapsetRegistry* registry, uint64_t capsetMask);
    ~ContextDispatcher();

    ContextDispatcher(const ContextDispatcher&) = delete;
    ContextDispatcher& operator=(const ContextDispatcher&) = delete;

    // Assembly time only. kAlreadyExists if a backend of the same component type was added.
    BrokerResult addBackend(std::unique_ptr<ContextBackend> backend);

    // Null when no backend of that type was added.
    ContextBackend* backendFor(ComponentType component) const;
    std::vector<ContextBackend*> backends() const;

    // Picks the backend owning capsetId. Fails with kUnsupported, without consuming a context id,
    // when the capset is unknown or masked, when the requested version is newer than the
    // registered one, or when hint names a different backend.
    BrokerResult createContext(uint32_t capsetId, uint32_t capsetVersion,
                               std::optional<ComponentType> hint, const std::string& name,
                               ContextId* outId);
    BrokerResult destroyContext(ContextId ctxId);
    void destroyAllContexts();

    bool contains(ContextId ctxId) const;
    BrokerResult getContextInfo(ContextId ctxId, ContextInfo* outInfo) const;

    BrokerResult submit(ContextId ctxId, const CommandBuffer& commands, const Fence& fence,
                        base::AsyncResult* outResult);

    BrokerResult attachResource(ContextId ctxId, const ContextResource& resource);
    BrokerResult detachResource(ContextId ctxId, ResourceId id);

    BrokerResult createContextBlob(ContextId ctxId, ResourceId id, const BlobCreateArgs& args,
                                   BackendResource* outResource);

   private:
    struct ContextEntry {
        ContextInfo info;
        // Shared so a request can run without holding the dispatcher lock while the context is
        // being destroyed.
        std::shared_ptr<BackendContext> context;
    };

    std::shared_ptr<BackendContext> findContext(ContextId ctxId) const;

    const CapsetRegistry* const mRegistry;
    const uint64_t mCapsetMask;

    // Declared before mContexts so contexts are destroyed ahead of their backends.
    std::vector<std::unique_ptr<ContextBackend>> mBackends;

    mutable android::base::Lock mLock;
    ContextId mNextContextId = 1;
    std::map<ContextId, ContextEntry> mContexts;
};

}  // namespace gfxbroker
