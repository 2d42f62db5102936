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

namespace gfxbroker {
namespace base {

class AsyncResult {
   public:
    // Describes how a backend will report the completion of work it accepted.
    enum ResultValue {
        // The backend will invoke the completion callback later, from any thread.
        OK_AND_CALLBACK_SCHEDULED,
        // The work was accepted but the backend will never report completion for it.
        OK_AND_CALLBACK_NOT_SCHEDULED,
        // The completion callback already ran before the call returned.
        OK_AND_CALLBACK_FIRED,
        FAIL_AND_CALLBACK_NOT_SCHEDULED,
    };

    constexpr AsyncResult() : value(FAIL_AND_CALLBACK_NOT_SCHEDULED) {}
    constexpr AsyncResult(ResultValue val) : value(val) {}
    constexpr bool Succeeded() const {
        return value != ResultValue::FAIL_AND_CALLBACK_NOT_SCHEDULED;
    }
    constexpr bool CallbackScheduledOrFired() const {
        return value == OK_AND_CALLBACK_SCHEDULED || value == OK_AND_CALLBACK_FIRED;
    }
    constexpr ResultValue Value() const { return value; }

   private:
    ResultValue value;
};

}  // namespace base
}  // namespace gfxbroker
