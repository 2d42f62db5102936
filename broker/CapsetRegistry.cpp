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

#include "CapsetRegistry.h"

#include <utility>

#include "host-common/BrokerFatalError.h"
#include "host-common/logging.h"

namespace gfxbroker {

BrokerResult CapsetRegistry::registerCapset(CapsetDescriptor capset, ComponentType component) {
    if (mFrozen) {
        GFXBROKER_ABORT(FatalError(ABORT_REASON_MISCONFIGURED))
            << "capset " << capset.id << " registered after the broker was assembled";
    }
    if (capset.id > kMaxCapsetId) {
        ERR("capset id %u cannot be represented in a capset mask", capset.id);
        return BrokerResult::kInvalidArgument;
    }
    for (const auto& entry : mCapsets) {
        if (entry.capset.id == capset.id) {
            ERR("capset id %u already registered by %s", capset.id, toString(entry.component));
            return BrokerResult::kAlreadyExists;
        }
    }
    mCapsets.push_back(Entry{std::move(capset), component});
    return BrokerResult::kOk;
}

void CapsetRegistry::freeze() { mFrozen = true; }

uint32_t CapsetRegistry::count(uint64_t mask) const {
    uint32_t visible = 0;
    for (const auto& entry : mCapsets) {
        if (mask & maskBit(entry.capset.id)) {
            ++visible;
        }
    }
    return visible;
}

const CapsetRegistry::Entry* CapsetRegistry::visibleAt(uint32_t index, uint64_t mask) const {
    uint32_t visible = 0;
    for (const auto& entry : mCapsets) {
        if (!(mask & maskBit(entry.capset.id))) {
            continue;
        }
        if (visible == index) {
            return &entry;
        }
        ++visible;
    }
    return nullptr;
}

BrokerResult CapsetRegistry::get(uint32_t index, uint64_t mask, CapsetDescriptor* out) const {
    const Entry* entry = visibleAt(index, mask);
    if (!entry) {
        return BrokerResult::kOutOfRange;
    }
    if (out) {
        *out = entry->capset;
    }
    return BrokerResult::kOk;
}

BrokerResult CapsetRegistry::getInfo(uint32_t index, uint64_t mask, CapsetInfo* out) const {
    const Entry* entry = visibleAt(index, mask);
    if (!entry) {
        return BrokerResult::kOutOfRange;
    }
    if (out) {
        out->id = entry->capset.id;
        out->maxVersion = entry->capset.version;
        out->maxSize = static_cast<uint32_t>(entry->capset.data.size());
    }
    return BrokerResult::kOk;
}

BrokerResult CapsetRegistry::find(uint32_t capsetId, uint64_t mask, CapsetDescriptor* out,
                                  ComponentType* component) const {
    if (!(mask & maskBit(capsetId))) {
        return BrokerResult::kNotFound;
    }
    for (const auto& entry : mCapsets) {
        if (entry.capset.id != capsetId) {
            continue;
        }
        if (out) {
            *out = entry.capset;
        }
        if (component) {
            *component = entry.component;
        }
        return BrokerResult::kOk;
    }
    return BrokerResult::kNotFound;
}

}  // namespace gfxbroker
