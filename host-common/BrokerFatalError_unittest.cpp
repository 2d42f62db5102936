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

#include <gmock/gmock.h>

#include "host-common/BrokerFatalError.h"

namespace gfxbroker {
namespace {

TEST(GFXBROKER_ABORT, MessageIsWellFormatted) {
    EXPECT_DEATH({ GFXBROKER_ABORT(FatalError(ABORT_REASON_OTHER)) << "I'm dying!"; },
                 R"re(F \S+:\d+:\S+: FATAL in \S+, err code: -4294967296: I'm dying!\n)re");
}

TEST(GFXBROKER_ABORT, WithVkResult) {
    EXPECT_DEATH({ GFXBROKER_ABORT(FatalError(VK_ERROR_DEVICE_LOST)) << "device gone"; },
                 R"re(err code: -4: device gone)re");
}

TEST(GFXBROKER_ABORT, MisconfiguredReason) {
    EXPECT_DEATH({ GFXBROKER_ABORT(FatalError(ABORT_REASON_MISCONFIGURED)) << "no backend"; },
                 R"re(err code: -4294967297: no backend)re");
}

}  // namespace
}  // namespace gfxbroker
