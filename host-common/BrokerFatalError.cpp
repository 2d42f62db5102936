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

#include "host-common/BrokerFatalError.h"

#include <cinttypes>
#include <cstdlib>
#include <ostream>

#include "base/Metrics.h"
#include "host-common/logging.h"

namespace gfxbroker {
namespace {

using base::BrokerAbort;
using base::CreateMetricsLogger;

[[noreturn]] void die() {
    // Kept out of line so that embedders can substitute their own crash handling.
    abort();
}

}  // namespace

AbortMessage::AbortMessage(const char* file, const char* function, int line, FatalError reason)
    : mFile(file), mFunction(function), mLine(line), mReason(reason) {
    mOss << "FATAL in " << function << ", err code: " << reason.getAbortCode() << ": ";
}

AbortMessage::~AbortMessage() {
    const std::string msg = mOss.str();
    fprintf(stderr, "F %s:%d:%s: %s\n", mFile, mLine, mFunction, msg.c_str());
    fflush(stderr);
    CreateMetricsLogger()->logMetricEvent(BrokerAbort{.file = mFile,
                                                      .function = mFunction,
                                                      .msg = msg.c_str(),
                                                      .line = mLine,
                                                      .abort_reason = mReason.getAbortCode()});

    die();
}

}  // namespace gfxbroker
