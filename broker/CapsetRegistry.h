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
#include <vector>

#include "BrokerTypes.h"

namespace gfxbroker {

// Ordered set of capability sets the assembled broker supports. Capsets are registered while the
// broker is being assembled; once frozen the registry is read-only and may be queried from any
// thread without locking.
//
// Every query takes a mask with one bit per capset id. Capsets whose bit is clear are invisible:
// they are skipped by enumeration and cannot be looked up by id.
class CapsetRegistry {
   public:
    static constexpr uint32_t kMaxCapsetId = 63;
    static constexpr uint64_t kAllCapsets = ~0ull;

    static constexpr uint64_t maskBit(uint32_t capsetId) {
        return capsetId > kMaxCapsetId ? 0 : (1ull << capsetId);
    }

    CapsetRegistry() = default;
    CapsetRegistry(const CapsetRegistry&) = delete;
    CapsetRegistry& operator=(const CapsetRegistry&) = delete;

    // Fails with kInvalidArgument for an id that cannot be masked, kAlreadyExists if the id is
    // already registered. Registering after freeze() is a programming error and aborts.
    BrokerResult registerCapset(CapsetDescriptor capset, ComponentType component);

    void freeze();
    bool isFrozen() const { return mFrozen; }

    uint32_t count(uint64_t mask) const;

    // Returns kOutOfRange when fewer than index + 1 capsets are visible through the mask.
    BrokerResult get(uint32_t index, uint64_t mask, CapsetDescriptor* out) const;
    BrokerResult getInfo(uint32_t index, uint64_t mask, CapsetInfo* out) const;

    // Looks a capset up by id. kNotFound if it was never registered or is masked out.
    BrokerResult find(uint32_t capsetId, uint64_t mask, CapsetDescriptor* out,
                      ComponentType* component) const;

   private:
    struct Entry {
        CapsetDescriptor capset;
        ComponentType component;
    };

    const Entry* visibleAt(uint32_t index, uint64_t mask) const;

    std::vector<Entry> mCapsets;
    bool mFrozen = false;
};

}  // namespace gfxbroker
