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

#include <vulkan/vulkan.h>

#include <cstdint>
#include <ostream>
#include <sstream>

namespace gfxbroker {

enum BrokerAbortReason : int64_t {
    VK_RESULT,
    ABORT_REASON_OTHER = -0x1'0000'0000,
    ABORT_REASON_MISCONFIGURED = -0x1'0000'0001,
};

struct FatalError {
    BrokerAbortReason abort_reason;
    VkResult vk_result;

    FatalError(BrokerAbortReason ab_reason) : abort_reason(ab_reason), vk_result(VK_SUCCESS) {}
    FatalError(VkResult vk_result) : abort_reason(VK_RESULT), vk_result(vk_result) {}

    inline int64_t getAbortCode() const {
        return abort_reason == VK_RESULT ? vk_result : abort_reason;
    }
};

class AbortMessage {
   public:
    AbortMessage(const char* file, const char* function, int line, FatalError reason);

    [[noreturn]] ~AbortMessage();

    std::ostream& stream() { return mOss; }

   private:
    const char* const mFile;
    const char* const mFunction;
    const int mLine;
    const FatalError mReason;
    std::ostringstream mOss;
};

}  // namespace gfxbroker

#define GFXBROKER_ABORT(reason) \
    ::gfxbroker::AbortMessage(__FILE__, __func__, __LINE__, reason).stream()
