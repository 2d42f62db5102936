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

#include "StubBackend.h"

#include "host-common/logging.h"

namespace gfxbroker {

using android::base::AutoLock;

namespace {

class StubContext : public BackendContext {
   public:
    ComponentType componentType() const override { return ComponentType::kStub; }

    BrokerResult submit(const CommandBuffer&, const Fence&, base::AsyncResult* outResult) override {
        *outResult = base::AsyncResult::OK_AND_CALLBACK_NOT_SCHEDULED;
        return BrokerResult::kOk;
    }

    BrokerResult attachResource(const ContextResource& resource) override {
        AutoLock lock(mLock);
        mAttached.insert(resource.id);
        return BrokerResult::kOk;
    }

    void detachResource(ResourceId id) override {
        AutoLock lock(mLock);
        mAttached.erase(id);
    }

   private:
    android::base::Lock mLock;
    std::set<ResourceId> mAttached;
};

}  // namespace

std::vector<CapsetDescriptor> StubBackend::capsets() const {
    return {CapsetDescriptor{.id = kCapsetMagma, .version = 0, .data = {}}};
}

BrokerResult StubBackend::initialize(BackendHost*) { return BrokerResult::kOk; }

BrokerResult StubBackend::createContext(ContextId ctxId, uint32_t capsetId, const std::string&,
                                        std::unique_ptr<BackendContext>* outContext) {
    if (capsetId != kCapsetMagma) {
        return BrokerResult::kUnsupported;
    }
    BROKER_DEBUG_LOG("stub context %u", ctxId);
    *outContext = std::make_unique<StubContext>();
    return BrokerResult::kOk;
}

BrokerResult StubBackend::createResource(ResourceId id, const ResourceCreateArgs& args,
                                         BackendResource* outResource) {
    AutoLock lock(mLock);
    mResources.insert(id);
    outResource->size = static_cast<uint64_t>(args.width) * args.height;
    return BrokerResult::kOk;
}

BrokerResult StubBackend::createBlob(ResourceId, const BlobCreateArgs&, const IovecList&,
                                     BackendResource*) {
    return BrokerResult::kUnsupported;
}

BrokerResult StubBackend::attachBacking(ResourceId id, const IovecList&) {
    AutoLock lock(mLock);
    return mResources.count(id) ? BrokerResult::kOk : BrokerResult::kNotFound;
}

void StubBackend::detachBacking(ResourceId) {}

BrokerResult StubBackend::transferToHost(ContextId, ResourceId id, const TransferBox&) {
    AutoLock lock(mLock);
    return mResources.count(id) ? BrokerResult::kOk : BrokerResult::kNotFound;
}

BrokerResult StubBackend::transferFromHost(ContextId, ResourceId id, const TransferBox&,
                                           const IovecList*) {
    AutoLock lock(mLock);
    return mResources.count(id) ? BrokerResult::kOk : BrokerResult::kNotFound;
}

void StubBackend::destroyResource(ResourceId id) {
    AutoLock lock(mLock);
    mResources.erase(id);
}

}  // namespace gfxbroker
