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
#include <gtest/gtest.h>
#include <unistd.h>

#include <thread>
#include <vector>

#include "ResourceTable.h"

namespace gfxbroker {
namespace {

using android::base::ManagedDescriptor;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

const auto kNoPendingFences = [](ResourceId) { return false; };

class ResourceTableTest : public ::testing::Test {
   protected:
    ResourceId createResource(uint32_t blobFlags = 0, bool blob = false) {
        ResourceId id = kInvalidResourceId;
        EXPECT_EQ(mTable.allocateId(&id), BrokerResult::kOk);
        ResourceInfo info;
        info.id = id;
        info.isBlob = blob;
        info.blobArgs.blobFlags = blobFlags;
        info.size = 4096;
        EXPECT_EQ(mTable.insert(info, {}, {}), BrokerResult::kOk);
        return id;
    }

    ManagedDescriptor makeDescriptor() {
        int fds[2];
        EXPECT_EQ(pipe(fds), 0);
        close(fds[1]);
        return ManagedDescriptor(fds[0]);
    }

    ResourceTable mTable;
};

TEST_F(ResourceTableTest, IdsAreMonotonicAndNeverReused) {
    std::vector<ResourceId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(createResource());
    }
    for (ResourceId id : ids) {
        ASSERT_EQ(mTable.remove(id, kNoPendingFences, nullptr), BrokerResult::kOk);
    }
    ResourceId next = createResource();
    for (ResourceId id : ids) {
        EXPECT_GT(next, id);
    }
}

TEST_F(ResourceTableTest, LookupAfterRemoveIsNotFound) {
    ResourceId id = createResource();
    ResourceInfo info;
    ASSERT_EQ(mTable.lookup(id, &info), BrokerResult::kOk);
    EXPECT_EQ(info.id, id);
    ASSERT_EQ(mTable.remove(id, kNoPendingFences, &info), BrokerResult::kOk);
    EXPECT_EQ(mTable.lookup(id, &info), BrokerResult::kNotFound);
    EXPECT_EQ(mTable.remove(id, kNoPendingFences, nullptr), BrokerResult::kNotFound);
}

TEST_F(ResourceTableTest, InsertRejectsUnallocatedAndDuplicateIds) {
    ResourceInfo info;
    info.id = 99;
    EXPECT_EQ(mTable.insert(info, {}, {}), BrokerResult::kInvariantViolation);

    info.id = createResource();
    EXPECT_EQ(mTable.insert(info, {}, {}), BrokerResult::kAlreadyExists);
    EXPECT_EQ(mTable.size(), 1u);
}

TEST_F(ResourceTableTest, BackingAttachAndDetach) {
    ResourceId id = createResource();
    std::vector<uint8_t> pages(64);
    IovecList iovecs{iovec{pages.data(), 32}, iovec{pages.data() + 32, 32}};

    EXPECT_EQ(mTable.detachBacking(id), BrokerResult::kInvalidArgument);
    ASSERT_EQ(mTable.attachBacking(id, iovecs), BrokerResult::kOk);
    EXPECT_EQ(mTable.attachBacking(id, iovecs), BrokerResult::kInvalidArgument);

    ResourceInfo info;
    ASSERT_EQ(mTable.lookup(id, &info), BrokerResult::kOk);
    EXPECT_EQ(info.backing, BackingKind::kGuestIovecs);
    EXPECT_EQ(info.numIovecs, 2u);

    ASSERT_EQ(mTable.detachBacking(id), BrokerResult::kOk);
    ASSERT_EQ(mTable.lookup(id, &info), BrokerResult::kOk);
    EXPECT_EQ(info.backing, BackingKind::kNone);
    EXPECT_EQ(mTable.attachBacking(12345, iovecs), BrokerResult::kNotFound);
}

TEST_F(ResourceTableTest, ExclusiveAttachRejectsSecondContext) {
    ResourceId id = createResource();
    ASSERT_EQ(mTable.attachToContext(id, 1), BrokerResult::kOk);
    EXPECT_EQ(mTable.attachToContext(id, 1), BrokerResult::kOk);
    EXPECT_EQ(mTable.attachToContext(id, 2), BrokerResult::kInUse);

    ASSERT_EQ(mTable.detachFromContext(id, 1), BrokerResult::kOk);
    EXPECT_EQ(mTable.detachFromContext(id, 1), BrokerResult::kInvalidArgument);
    EXPECT_EQ(mTable.attachToContext(id, 2), BrokerResult::kOk);
}

TEST_F(ResourceTableTest, ShareableBlobsAttachToManyContexts) {
    ResourceId id = createResource(kBlobFlagUseShareable, /*blob=*/true);
    ASSERT_EQ(mTable.attachToContext(id, 1), BrokerResult::kOk);
    ASSERT_EQ(mTable.attachToContext(id, 2), BrokerResult::kOk);

    ResourceInfo info;
    ASSERT_EQ(mTable.lookup(id, &info), BrokerResult::kOk);
    EXPECT_THAT(info.attachedContexts, ElementsAre(1, 2));
}

TEST_F(ResourceTableTest, DetachAllFromContextLeavesResourcesAlive) {
    ResourceId a = createResource();
    ResourceId b = createResource();
    ResourceId c = createResource();
    ASSERT_EQ(mTable.attachToContext(a, 1), BrokerResult::kOk);
    ASSERT_EQ(mTable.attachToContext(b, 1), BrokerResult::kOk);
    ASSERT_EQ(mTable.attachToContext(c, 2), BrokerResult::kOk);

    EXPECT_THAT(mTable.detachAllFromContext(1), UnorderedElementsAre(a, b));
    EXPECT_THAT(mTable.resourcesAttachedTo(1), IsEmpty());
    EXPECT_THAT(mTable.resourcesAttachedTo(2), ElementsAre(c));
    EXPECT_TRUE(mTable.contains(a));
    EXPECT_TRUE(mTable.contains(b));
}

TEST_F(ResourceTableTest, RemoveDropsContextAttachments) {
    ResourceId id = createResource();
    ASSERT_EQ(mTable.attachToContext(id, 1), BrokerResult::kOk);
    ASSERT_EQ(mTable.remove(id, kNoPendingFences, nullptr), BrokerResult::kOk);
    EXPECT_THAT(mTable.resourcesAttachedTo(1), IsEmpty());
}

TEST_F(ResourceTableTest, ScanoutReferenceBlocksRemove) {
    ResourceId id = createResource();
    ASSERT_EQ(mTable.addScanoutRef(id), BrokerResult::kOk);
    EXPECT_EQ(mTable.remove(id, kNoPendingFences, nullptr), BrokerResult::kInUse);
    ASSERT_EQ(mTable.removeScanoutRef(id), BrokerResult::kOk);
    EXPECT_EQ(mTable.removeScanoutRef(id), BrokerResult::kInvariantViolation);
    EXPECT_EQ(mTable.remove(id, kNoPendingFences, nullptr), BrokerResult::kOk);
}

TEST_F(ResourceTableTest, PendingFenceBlocksRemove) {
    ResourceId id = createResource();
    bool pending = true;
    auto hasPending = [&](ResourceId resourceId) { return resourceId == id && pending; };
    EXPECT_EQ(mTable.remove(id, hasPending, nullptr), BrokerResult::kInUse);
    pending = false;
    EXPECT_EQ(mTable.remove(id, hasPending, nullptr), BrokerResult::kOk);
}

TEST_F(ResourceTableTest, ExportKeepsTheFirstCanonicalHandle) {
    ResourceId id = createResource();
    ResourceInfo info;
    ASSERT_EQ(mTable.lookup(id, &info), BrokerResult::kOk);
    EXPECT_FALSE(info.exported);

    ExportedHandle first;
    ASSERT_EQ(mTable.publishExport(id, makeDescriptor(), kMemHandleTypeOpaqueFd, &first),
              BrokerResult::kOk);
    ExportedHandle second;
    ASSERT_EQ(mTable.publishExport(id, makeDescriptor(), kMemHandleTypeShm, &second),
              BrokerResult::kOk);
    EXPECT_EQ(first.osHandle, second.osHandle);
    EXPECT_EQ(second.handleType, kMemHandleTypeOpaqueFd);

    ASSERT_EQ(mTable.lookup(id, &info), BrokerResult::kOk);
    EXPECT_TRUE(info.exported);
    EXPECT_EQ(info.exportHandle.osHandle, first.osHandle);
}

TEST_F(ResourceTableTest, DuplicateExportIsIndependentlyOwned) {
    ResourceId id = createResource();
    ExportedHandle canonical;
    ASSERT_EQ(mTable.publishExport(id, makeDescriptor(), kMemHandleTypeOpaqueFd, &canonical),
              BrokerResult::kOk);

    ManagedDescriptor duplicate;
    uint32_t handleType = 0;
    ASSERT_EQ(mTable.duplicateExport(id, &duplicate, &handleType), BrokerResult::kOk);
    ASSERT_TRUE(duplicate.get().has_value());
    EXPECT_NE(*duplicate.get(), canonical.osHandle);
    EXPECT_EQ(handleType, kMemHandleTypeOpaqueFd);
}

TEST_F(ResourceTableTest, MappingRequiresMappableBlob) {
    ResourceId id = kInvalidResourceId;
    ASSERT_EQ(mTable.allocateId(&id), BrokerResult::kOk);
    std::vector<uint8_t> hostMemory(4096);
    ResourceInfo info;
    info.id = id;
    info.isBlob = true;
    info.blobArgs.blobFlags = kBlobFlagUseMappable;
    info.backing = BackingKind::kHostMemory;
    ASSERT_EQ(mTable.insert(info, {}, ResourceMapping{hostMemory.data(), hostMemory.size()}),
              BrokerResult::kOk);

    ResourceMapping mapping;
    ASSERT_EQ(mTable.getMapping(id, &mapping), BrokerResult::kOk);
    EXPECT_EQ(mapping.hva, hostMemory.data());
    EXPECT_EQ(mapping.size, hostMemory.size());

    EXPECT_EQ(mTable.getMapping(createResource(), &mapping), BrokerResult::kUnsupported);
}

TEST_F(ResourceTableTest, ConcurrentAttachAndRemoveStayConsistent) {
    constexpr int kIterations = 500;
    for (int i = 0; i < kIterations; ++i) {
        ResourceId id = createResource();
        BrokerResult attachResult = BrokerResult::kOk;
        BrokerResult removeResult = BrokerResult::kOk;
        std::thread attacher([&] { attachResult = mTable.attachToContext(id, 7); });
        std::thread remover([&] { removeResult = mTable.remove(id, kNoPendingFences, nullptr); });
        attacher.join();
        remover.join();

        ASSERT_EQ(removeResult, BrokerResult::kOk);
        EXPECT_TRUE(attachResult == BrokerResult::kOk || attachResult == BrokerResult::kNotFound);
        EXPECT_THAT(mTable.resourcesAttachedTo(7), IsEmpty());
    }
}

}  // namespace
}  // namespace gfxbroker
