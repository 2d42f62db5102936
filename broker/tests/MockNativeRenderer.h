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

#include <gmock/gmock.h>

#include "contexts/NativeRenderer.h"

namespace gfxbroker {

class MockNativeRenderer : public NativeRenderer {
   public:
    MOCK_METHOD(std::vector<CapsetDescriptor>, capsets, (), (const, override));
    MOCK_METHOD(VkResult, createContext, (ContextId, uint32_t, const std::string&), (override));
    MOCK_METHOD(void, destroyContext, (ContextId), (override));
    MOCK_METHOD(VkResult, createResource, (ResourceId, const ResourceCreateArgs&, uint64_t*),
                (override));
    MOCK_METHOD(VkResult, createBlob,
                (ResourceId, const BlobCreateArgs&, const IovecList&, NativeBlob*), (override));
    MOCK_METHOD(void, destroyResource, (ResourceId), (override));
    MOCK_METHOD(VkResult, attachBacking, (ResourceId, const IovecList&), (override));
    MOCK_METHOD(void, detachBacking, (ResourceId), (override));
    MOCK_METHOD(VkResult, attachResource, (ContextId, ResourceId), (override));
    MOCK_METHOD(void, detachResource, (ContextId, ResourceId), (override));
    MOCK_METHOD(VkResult, transferWrite, (ContextId, ResourceId, const TransferBox&), (override));
    MOCK_METHOD(VkResult, transferRead,
                (ContextId, ResourceId, const TransferBox&, const IovecList*), (override));
    MOCK_METHOD(VkResult, submitCommands, (ContextId, const uint8_t*, size_t), (override));
    MOCK_METHOD(void, asyncWaitForGpu, (ContextId, uint8_t, CompletionCallback), (override));
    MOCK_METHOD(VkResult, exportBlob, (ResourceId, int*, uint32_t*), (override));
    MOCK_METHOD(VkResult, unmapBlob, (ResourceId), (override));
    MOCK_METHOD(VkResult, exportSyncFd, (ContextId, uint8_t, int*), (override));
    MOCK_METHOD(void, finish, (), (override));
};

}  // namespace gfxbroker
