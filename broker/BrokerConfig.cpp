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

#include "BrokerConfig.h"

#include <cerrno>
#include <cstdlib>
#include <utility>

#include "aemu/base/system/System.h"
#include "host-common/logging.h"

namespace gfxbroker {

using android::base::getEnvironmentVariable;

std::optional<uint64_t> parseConfigValue(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = strtoull(value.c_str(), &end, 0);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(parsed);
}

BrokerConfig BrokerConfig::fromEnvironment(BrokerConfig base) {
    BrokerConfig config = std::move(base);

    const std::string mask = getEnvironmentVariable("GFXBROKER_CAPSET_MASK");
    if (!mask.empty()) {
        if (auto parsed = parseConfigValue(mask)) {
            config.capsetMask = *parsed;
        } else {
            ERR("Ignoring GFXBROKER_CAPSET_MASK=%s", mask.c_str());
        }
    }

    const std::string scanouts = getEnvironmentVariable("GFXBROKER_NUM_SCANOUTS");
    if (!scanouts.empty()) {
        auto parsed = parseConfigValue(scanouts);
        if (parsed && *parsed >= 1 && *parsed <= kMaxScanouts) {
            config.numScanouts = static_cast<uint32_t>(*parsed);
        } else {
            ERR("Ignoring GFXBROKER_NUM_SCANOUTS=%s", scanouts.c_str());
        }
    }

    const std::string verbose = getEnvironmentVariable("GFXBROKER_VERBOSE");
    if (!verbose.empty()) {
        auto parsed = parseConfigValue(verbose);
        config.verbose = parsed && *parsed != 0;
    }
    return config;
}

BrokerConfig BrokerConfig::fromEnvironment() { return fromEnvironment(BrokerConfig()); }

}  // namespace gfxbroker
