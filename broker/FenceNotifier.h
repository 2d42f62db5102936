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

#include <future>
#include <variant>

#include "BrokerTypes.h"
#include "aemu/base/threads/WorkerThread.h"

namespace gfxbroker {

// Delivers fence completions to the embedder's callback on a dedicated thread, in the order the
// fence handler retired them. Backend threads that signal fences never run embedder code.
class FenceNotifier {
   public:
    explicit FenceNotifier(FenceCompletionCallback callback);
    ~FenceNotifier();

    FenceNotifier(const FenceNotifier&) = delete;
    FenceNotifier& operator=(const FenceNotifier&) = delete;

    void notify(const FenceCompletion& completion);

    // Returns once every completion queued before the call has been delivered.
    void waitForPendingNotifications();

    void stop();

   private:
    struct Flush {
        std::promise<void> delivered;
    };
    struct Exit {};
    using Command = std::variant<FenceCompletion, Flush, Exit>;

    android::base::WorkerProcessingResult process(Command&& command);

    FenceCompletionCallback mCallback;
    android::base::WorkerThread<Command> mWorkerThread;
    bool mStopped = false;
};

}  // namespace gfxbroker
