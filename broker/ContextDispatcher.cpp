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

#include "ContextDispatcher.h"

#include <utility>

#include "host-common/logging.h"

namespace gfxbroker {

using android::base::AutoLock;

ContextDispatcher::ContextDispatcher(const CapsetRegistry* registry, uint64_t capsetMask)
    : mRegistry(registry), mCapsetMask(capsetMask) {}

ContextDispatcher::~ContextDispatcher() { destroyAllContexts(); }

BrokerResult ContextDispatcher::addBackend(std::unique_ptr<ContextBackend> backend) {
    if (!backend) {
        return BrokerResult::kInvalidArgument;
    }
    if (backendFor(backend->componentType())) {
        ERR("Component %s was added twice.", toString(backend->componentType()));
        return BrokerResult::kAlreadyExists;
    }
    mBackends.push_back(std::move(backend));
    return BrokerResult::kOk;
}

ContextBackend* ContextDispatcher::backendFor(ComponentType component) const {
    for (const auto& backend : mBackends) {
        if (backend->componentType() == component) {
            return backend.get();
        }
    }
    return nullptr;
}

std::vector<ContextBackend*> ContextDispatcher::backends() const {
    std::vector<ContextBackend*> result;
    for (const auto& backend : mBackends) {
        result.push_back(backend.get());
    }
    return result;
}

BrokerResult ContextDispatcher::createContext(uint32_t capsetId, uint32_t capsetVersion,
                                              std::optional<ComponentType> hint,
                                              const std::string& name, ContextId* outId) {
    CapsetDescriptor capset;
    ComponentType component;
    if (mRegistry->find(capsetId, mCapsetMask, &capset, &component) != BrokerResult::kOk) {
        ERR("Capset %u is not available to guests.", capsetId);
        return BrokerResult::kUnsupported;
    }
    if (capsetVersion > capset.version) {
        ERR("Capset %u version %u requested, only %u is supported.", capsetId, capsetVersion,
            capset.version);
        return BrokerResult::kUnsupported;
    }
    if (hint && *hint != component) {
        ERR("Capset %u belongs to %s, not %s.", capsetId, toString(component), toString(*hint));
        return BrokerResult::kUnsupported;
    }
    ContextBackend* backend = backendFor(component);
    if (!backend) {
        return BrokerResult::kUnsupported;
    }

    AutoLock lock(mLock);
    if (mNextContextId == 0) {
        return BrokerResult::kUnsupported;
    }
    const ContextId ctxId = mNextContextId;
    std::unique_ptr<BackendContext> context;
    BrokerResult result = backend->createContext(ctxId, capsetId, name, &context);
    if (result != BrokerResult::kOk) {
        return result;
    }
    if (!context) {
        ERR("%s returned no context for capset %u.", toString(component), capsetId);
        return BrokerResult::kBackendFailure;
    }
    ++mNextContextId;
    mContexts[ctxId] = ContextEntry{
        .info = ContextInfo{.id = ctxId,
                            .component = component,
                            .capsetId = capsetId,
                            .capsetVersion = capsetVersion,
                            .name = name},
        .context = std::move(context),
    };
    *outId = ctxId;
    return BrokerResult::kOk;
}

BrokerResult ContextDispatcher::destroyContext(ContextId ctxId) {
    std::shared_ptr<BackendContext> context;
    {
        AutoLock lock(mLock);
        auto it = mContexts.find(ctxId);
        if (it == mContexts.end()) {
            return BrokerResult::kNotFound;
        }
        context = std::move(it->second.context);
        mContexts.erase(it);
    }
    // The backend context is torn down here, outside the lock.
    context.reset();
    return BrokerResult::kOk;
}

void ContextDispatcher::destroyAllContexts() {
    std::map<ContextId, ContextEntry> contexts;
    {
        AutoLock lock(mLock);
        contexts.swap(mContexts);
    }
    contexts.clear();
}

bool ContextDispatcher::contains(ContextId ctxId) const {
    AutoLock lock(mLock);
    return mContexts.count(ctxId) != 0;
}

BrokerResult ContextDispatcher::getContextInfo(ContextId ctxId, ContextInfo* outInfo) const {
    AutoLock lock(mLock);
    auto it = mContexts.find(ctxId);
    if (it == mContexts.end()) {
        return BrokerResult::kNotFound;
    }
    *outInfo = it->second.info;
    return BrokerResult::kOk;
}

std::shared_ptr<BackendContext> ContextDispatcher::findContext(ContextId ctxId) const {
    AutoLock lock(mLock);
    auto it = mContexts.find(ctxId);
    if (it == mContexts.end()) {
        return nullptr;
    }
    return it->second.context;
}

BrokerResult ContextDispatcher::submit(ContextId ctxId, const CommandBuffer& commands,
                                       const Fence& fence, base::AsyncResult* outResult) {
    auto context = findContext(ctxId);
    if (!context) {
        return BrokerResult::kNotFound;
    }
    return context->submit(commands, fence, outResult);
}

BrokerResult ContextDispatcher::attachResource(ContextId ctxId,
                                               const ContextResource& resource) {
    auto context = findContext(ctxId);
    if (!context) {
        return BrokerResult::kNotFound;
    }
    return context->attachResource(resource);
}

BrokerResult ContextDispatcher::detachResource(ContextId ctxId, ResourceId id) {
    auto context = findContext(ctxId);
    if (!context) {
        return BrokerResult::kNotFound;
    }
    context->detachResource(id);
    return BrokerResult::kOk;
}

BrokerResult ContextDispatcher::createContextBlob(ContextId ctxId, ResourceId id,
                                                  const BlobCreateArgs& args,
                                                  BackendResource* outResource) {
    auto context = findContext(ctxId);
    if (!context) {
        return BrokerResult::kNotFound;
    }
    return context->createBlob(id, args, outResource);
}

}  // namespace gfxbroker
