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

#include <memory>
#include <string>
#include <vector>

#include "contexts/ContextBackend.h"

namespace gfxbroker {

class MockBackendContext : public BackendContext {
   public:
    MOCK_METHOD(ComponentType, componentType, (), (const, override));
    MOCK_METHOD(BrokerResult, submit, (const CommandBuffer&, const Fence&, base::AsyncResult*),
                (override));
    MOCK_METHOD(BrokerResult, createBlob, (ResourceId, const BlobCreateArgs&, BackendResource*),
                (override));
    MOCK_METHOD(BrokerResult, attachResource, (const ContextResource&), (override));
    MOCK_METHOD(void, detachResource, (ResourceId), (override));
};

class MockBackend : public ContextBackend {
   public:
    MOCK_METHOD(ComponentType, componentType, (), (const, override));
    MOCK_METHOD(std::vector<CapsetDescriptor>, capsets, (), (const, override));
    MOCK_METHOD(BrokerResult, initialize, (BackendHost*), (override));
    MOCK_METHOD(BrokerResult, createContext,
                (ContextId, uint32_t, const std::string&, std::unique_ptr<BackendContext>*),
                (override));
    MOCK_METHOD(BrokerResult, createResource,
                (ResourceId, const ResourceCreateArgs&, BackendResource*), (override));
    MOCK_METHOD(BrokerResult, createBlob,
                (ResourceId, const BlobCreateArgs&, const IovecList&, BackendResource*),
                (override));
    MOCK_METHOD(BrokerResult, attachBacking, (ResourceId, const IovecList&), (override));
    MOCK_METHOD(void, detachBacking, (ResourceId), (override));
    MOCK_METHOD(BrokerResult, transferToHost, (ContextId, ResourceId, const TransferBox&),
                (override));
    MOCK_METHOD(BrokerResult, transferFromHost,
                (ContextId, ResourceId, const TransferBox&, const IovecList*), (override));
    MOCK_METHOD(BrokerResult, exportResource, (ResourceId, ExportedDescriptor*), (override));
    MOCK_METHOD(BrokerResult, unmapResource, (ResourceId), (override));
    MOCK_METHOD(BrokerResult, exportFence, (ContextId, uint8_t, FenceId, ExportedDescriptor*),
                (override));
    MOCK_METHOD(void, destroyResource, (ResourceId), (override));
    MOCK_METHOD(void, onScanoutBound, (ResourceId, const ScanoutInfo&), (override));
};

// A mock backend of the given type advertising the given capsets. Everything else succeeds by
// default.
inline std::unique_ptr<::testing::NiceMock<MockBackend>> makeMockBackend(
    ComponentType component, std::vector<CapsetDescriptor> capsets) {
    using ::testing::_;
    using ::testing::Return;
    auto backend = std::make_unique<::testing::NiceMock<MockBackend>>();
    ON_CALL(*backend, componentType()).WillByDefault(Return(component));
    ON_CALL(*backend, capsets()).WillByDefault(Return(capsets));
    ON_CALL(*backend, initialize(_)).WillByDefault(Return(BrokerResult::kOk));
    ON_CALL(*backend, createResource(_, _, _)).WillByDefault(Return(BrokerResult::kOk));
    ON_CALL(*backend, createBlob(_, _, _, _)).WillByDefault(Return(BrokerResult::kOk));
    ON_CALL(*backend, attachBacking(_, _)).WillByDefault(Return(BrokerResult::kOk));
    ON_CALL(*backend, transferToHost(_, _, _)).WillByDefault(Return(BrokerResult::kOk));
    ON_CALL(*backend, transferFromHost(_, _, _, _)).WillByDefault(Return(BrokerResult::kOk));
    ON_CALL(*backend, exportResource(_, _)).WillByDefault(Return(BrokerResult::kUnsupported));
    ON_CALL(*backend, unmapResource(_)).WillByDefault(Return(BrokerResult::kOk));
    ON_CALL(*backend, exportFence(_, _, _, _)).WillByDefault(Return(BrokerResult::kUnsupported));
    return backend;
}

}  // namespace gfxbroker
