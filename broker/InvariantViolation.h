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

#include "base/Metrics.h"

// Reports broker bookkeeping that has become inconsistent. The caller still returns
// BrokerResult::kInvariantViolation; this only makes the event visible.
#define GFXBROKER_REPORT_INVARIANT_VIOLATION(ctx, fence, message)                       \
    ::gfxbroker::base::CreateMetricsLogger()->logMetricEvent(                           \
        ::gfxbroker::base::BrokerInvariantViolation{.file = __FILE__,                  \
                                                    .function = __func__,              \
                                                    .msg = (message),                  \
                                                    .line = __LINE__,                  \
                                                    .contextId = (ctx),                \
                                                    .fenceId = (fence)})
