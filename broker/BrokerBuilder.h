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

#include <memory>
#include <vector>

#include "Broker.h"
#include "BrokerConfig.h"
#include "contexts/ContextBackend.h"

namespace gfxbroker {

// Assembles a Broker. Backends register their capsets in the order they were added; the
// registry is frozen and every backend initialized before the broker is handed out.
class BrokerBuilder {
   public:
    explicit BrokerBuilder(BrokerConfig config = BrokerConfig());

    BrokerBuilder& addBackend(std::unique_ptr<ContextBackend> backend);

    // Fails with kInvalidArgument for two backends of one type, clashing capset ids or a bad
    // scanout count. Missing the default backend, or building twice, aborts.
    BrokerResult build(std::unique_ptr<Broker>* outBroker);

   private:
    BrokerConfig mConfig;
    std::vector<std::unique_ptr<ContextBackend>> mBackends;
    bool mBuilt = false;
};

}  // namespace gfxbroker
