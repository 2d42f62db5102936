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
#include <optional>
#include <string>

#include "BrokerTypes.h"
#include "CapsetRegistry.h"

namespace gfxbroker {

constexpr uint32_t kMaxScanouts = 16;

// Settings fixed when the broker is assembled. Nothing here can change afterwards.
struct BrokerConfig {
    // One bit per capset id. Capsets with a clear bit are invisible to guests.
    uint64_t capsetMask = CapsetRegistry::kAllCapsets;
    // Backend for context-less resources.
    ComponentType defaultComponent = ComponentType::k2D;
    uint32_t numScanouts = 1;
    // Traces context, resource and scanout lifecycle with INFO.
    bool verbose = false;
    // Receives retired fences on the notification thread. Optional.
    FenceCompletionCallback fenceCallback;

    // Returns base with GFXBROKER_CAPSET_MASK, GFXBROKER_NUM_SCANOUTS and GFXBROKER_VERBOSE
    // applied. Values that do not parse are logged and ignored.
    static BrokerConfig fromEnvironment(BrokerConfig base);
    static BrokerConfig fromEnvironment();
};

// Parses a decimal, hex (0x) or octal (0) unsigned value. Exposed for testing.
std::optional<uint64_t> parseConfigValue(const std::string& value);

}  // namespace gfxbroker
