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

#include "BrokerBuilder.h"

#include <set>
#include <utility>

#include "host-common/BrokerFatalError.h"
#include "host-common/logging.h"

namespace gfxbroker {

BrokerBuilder::BrokerBuilder(BrokerConfig config) : mConfig(std::move(config)) {}

BrokerBuilder& BrokerBuilder::addBackend(std::unique_ptr<ContextBackend> backend) {
    mBackends.push_back(std::move(backend));
    return *this;
}

BrokerResult BrokerBuilder::build(std::unique_ptr<Broker>* outBroker) {
    if (mBuilt) {
        GFXBROKER_ABORT(FatalError(ABORT_REASON_MISCONFIGURED))
            << "a BrokerBuilder can only build one broker";
    }
    mBuilt = true;

    if (mConfig.numScanouts < 1 || mConfig.numScanouts > kMaxScanouts) {
        ERR("%u scanouts requested, 1 to %u are supported.", mConfig.numScanouts, kMaxScanouts);
        return BrokerResult::kInvalidArgument;
    }

    std::set<ComponentType> components;
    std::set<uint32_t> capsetIds;
    for (const auto& backend : mBackends) {
        if (!backend) {
            return BrokerResult::kInvalidArgument;
        }
        if (!components.insert(backend->componentType()).second) {
            ERR("More than one %s backend.", toString(backend->componentType()));
            return BrokerResult::kInvalidArgument;
        }
        for (const CapsetDescriptor& capset : backend->capsets()) {
            if (!capsetIds.insert(capset.id).second) {
                ERR("Capset %u is advertised by more than one backend.", capset.id);
                return BrokerResult::kInvalidArgument;
            }
        }
    }
    if (!components.count(mConfig.defaultComponent)) {
        GFXBROKER_ABORT(FatalError(ABORT_REASON_MISCONFIGURED))
            << "default component " << toString(mConfig.defaultComponent)
            << " has no backend";
    }

    std::unique_ptr<Broker> broker(new Broker(mConfig));
    for (auto& backend : mBackends) {
        const ComponentType component = backend->componentType();
        for (CapsetDescriptor& capset : backend->capsets()) {
            BrokerResult result = broker->mCapsets.registerCapset(std::move(capset), component);
            if (result != BrokerResult::kOk) {
                return BrokerResult::kInvalidArgument;
            }
        }
        BrokerResult result = broker->mDispatcher.addBackend(std::move(backend));
        if (result != BrokerResult::kOk) {
            return BrokerResult::kInvalidArgument;
        }
    }
    mBackends.clear();
    broker->mCapsets.freeze();

    for (ContextBackend* backend : broker->mDispatcher.backends()) {
        BrokerResult result = backend->initialize(broker.get());
        if (result != BrokerResult::kOk) {
            ERR("Failed to initialize the %s backend: %s", toString(backend->componentType()),
                toString(result));
            return result;
        }
    }

    if (mConfig.verbose) {
        INFO("broker assembled: %zu backends, %u visible capsets, %u scanouts",
             broker->mDispatcher.backends().size(), broker->getCapsetCount(),
             mConfig.numScanouts);
    }
    *outBroker = std::move(broker);
    return BrokerResult::kOk;
}

}  // namespace gfxbroker
