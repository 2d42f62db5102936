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

#include "FenceNotifier.h"

#include <utility>

#include "host-common/BrokerFatalError.h"

namespace gfxbroker {

using android::base::WorkerProcessingResult;

FenceNotifier::FenceNotifier(FenceCompletionCallback callback)
    : mCallback(std::move(callback)),
      mWorkerThread([this](Command&& command) { return process(std::move(command)); }) {
    if (!mWorkerThread.start()) {
        GFXBROKER_ABORT(FatalError(ABORT_REASON_OTHER)) << "failed to start the fence notifier";
    }
}

FenceNotifier::~FenceNotifier() { stop(); }

void FenceNotifier::notify(const FenceCompletion& completion) {
    mWorkerThread.enqueue(Command(completion));
}

void FenceNotifier::waitForPendingNotifications() {
    Flush flush;
    std::future<void> delivered = flush.delivered.get_future();
    mWorkerThread.enqueue(Command(std::move(flush)));
    delivered.wait();
}

void FenceNotifier::stop() {
    if (mStopped) {
        return;
    }
    mStopped = true;
    mWorkerThread.enqueue(Command(Exit{}));
    mWorkerThread.join();
}

WorkerProcessingResult FenceNotifier::process(Command&& command) {
    struct {
        FenceNotifier* notifier;
        WorkerProcessingResult operator()(const FenceCompletion& completion) {
            if (notifier->mCallback) {
                notifier->mCallback(completion);
            }
            return WorkerProcessingResult::Continue;
        }
        WorkerProcessingResult operator()(Flush& flush) {
            flush.delivered.set_value();
            return WorkerProcessingResult::Continue;
        }
        WorkerProcessingResult operator()(const Exit&) { return WorkerProcessingResult::Stop; }
    } visitor{this};
    return std::visit(visitor, command);
}

}  // namespace gfxbroker
