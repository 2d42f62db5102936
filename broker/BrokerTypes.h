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

#include <sys/uio.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace gfxbroker {

using ResourceId = uint32_t;
using ContextId = uint32_t;
using FenceId = uint64_t;

constexpr ResourceId kInvalidResourceId = 0;
constexpr ContextId kNoContext = 0;
constexpr FenceId kInvalidFenceId = 0;

// Status of every broker operation. Values are returned, never thrown.
enum class BrokerResult : int32_t {
    kOk = 0,
    kNotFound,
    kAlreadyExists,
    kUnsupported,
    kInUse,
    kBackendFailure,
    kInvalidArgument,
    kOutOfRange,
    // The broker's own bookkeeping is inconsistent. Never produced by malformed guest input.
    kInvariantViolation,
};

const char* toString(BrokerResult result);

// virtio-gpu control queue response codes.
constexpr uint32_t kVirtioGpuRespOkNodata = 0x1100;
constexpr uint32_t kVirtioGpuRespErrUnspec = 0x1200;
constexpr uint32_t kVirtioGpuRespErrOutOfMemory = 0x1201;
constexpr uint32_t kVirtioGpuRespErrInvalidScanoutId = 0x1202;
constexpr uint32_t kVirtioGpuRespErrInvalidResourceId = 0x1203;
constexpr uint32_t kVirtioGpuRespErrInvalidContextId = 0x1204;
constexpr uint32_t kVirtioGpuRespErrInvalidParameter = 0x1205;

// What the failing request was addressing, used to pick the closest protocol error.
enum class ResponseScope { kResource, kContext, kScanout, kOther };

uint32_t virtioGpuResponseFor(BrokerResult result, ResponseScope scope);

enum class ComponentType : uint8_t {
    k2D = 0,
    kNativeRender = 1,
    kCrossDomain = 2,
    kStub = 3,
};

const char* toString(ComponentType type);

constexpr uint32_t componentBit(ComponentType type) {
    return 1u << static_cast<uint8_t>(type);
}

// Capset ids as assigned by the virtio-gpu specification.
constexpr uint32_t kCapsetVirgl = 1;
constexpr uint32_t kCapsetVirgl2 = 2;
constexpr uint32_t kCapsetGfxstreamVulkan = 3;
constexpr uint32_t kCapsetVenus = 4;
constexpr uint32_t kCapsetCrossDomain = 5;
constexpr uint32_t kCapsetDrm = 6;
constexpr uint32_t kCapsetMagma = 7;
constexpr uint32_t kCapsetGfxstreamGles = 8;
constexpr uint32_t kCapsetGfxstreamComposer = 9;

constexpr uint32_t kBlobMemGuest = 0x0001;
constexpr uint32_t kBlobMemHost3d = 0x0002;
constexpr uint32_t kBlobMemHost3dGuest = 0x0003;

constexpr uint32_t kBlobFlagUseMappable = 0x0001;
constexpr uint32_t kBlobFlagUseShareable = 0x0002;
constexpr uint32_t kBlobFlagUseCrossDevice = 0x0004;

constexpr uint32_t kMemHandleTypeOpaqueFd = 0x1;
constexpr uint32_t kMemHandleTypeDmabuf = 0x2;
constexpr uint32_t kMemHandleTypeShm = 0x3;

constexpr uint32_t kFenceHandleTypeOpaqueFd = 0x10;
constexpr uint32_t kFenceHandleTypeSyncFd = 0x20;

constexpr uint32_t kMapCacheMask = 0x0f;
constexpr uint32_t kMapCacheCached = 0x01;
constexpr uint32_t kMapCacheUncached = 0x02;
constexpr uint32_t kMapCacheWc = 0x03;
constexpr uint32_t kMapAccessMask = 0xf0;
constexpr uint32_t kMapAccessRead = 0x10;
constexpr uint32_t kMapAccessWrite = 0x20;
constexpr uint32_t kMapAccessRw = 0x30;

constexpr uint32_t kPipeTexture2D = 2;

using IovecList = std::vector<iovec>;

struct ResourceCreateArgs {
    // kNoContext for context-less (2D and display) resources.
    ContextId ctxId = kNoContext;
    uint32_t target = kPipeTexture2D;
    uint32_t format = 0;
    uint32_t bind = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t depth = 1;
    uint32_t arraySize = 1;
    uint32_t lastLevel = 0;
    uint32_t nrSamples = 0;
    uint32_t flags = 0;
};

struct BlobCreateArgs {
    ContextId ctxId = kNoContext;
    uint32_t blobMem = kBlobMemGuest;
    uint32_t blobFlags = 0;
    uint64_t blobId = 0;
    uint64_t size = 0;
};

struct TransferBox {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t z = 0;
    uint32_t w = 0;
    uint32_t h = 0;
    uint32_t d = 1;
    uint32_t level = 0;
    uint32_t stride = 0;
    uint32_t layerStride = 0;
    uint64_t offset = 0;

    bool isEmpty() const { return w == 0 || h == 0 || d == 0; }
};

struct CommandBuffer {
    const uint8_t* data = nullptr;
    size_t size = 0;
};

struct ResourceMapping {
    void* hva = nullptr;
    uint64_t size = 0;
};

// Raw platform handle handed out by export. The broker keeps ownership of the descriptor; the
// receiver must not close it and must not assume it outlives the resource.
struct ExportedHandle {
    int64_t osHandle = -1;
    uint32_t handleType = 0;
};

struct ScanoutInfo {
    uint32_t scanoutId = 0;
    // kInvalidResourceId disables the scanout.
    ResourceId resourceId = kInvalidResourceId;
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    // Zero means the resource's own format.
    uint32_t format = 0;
    // Zero is only accepted for non-blob resources and means the packed stride.
    uint32_t stride = 0;
    uint64_t offset = 0;
};

struct CapsetDescriptor {
    uint32_t id = 0;
    uint32_t version = 0;
    std::vector<uint8_t> data;
};

struct CapsetInfo {
    uint32_t id = 0;
    uint32_t maxVersion = 0;
    uint32_t maxSize = 0;
};

struct FenceRingGlobal {
    bool operator==(const FenceRingGlobal&) const { return true; }
};
struct FenceRingContextSpecific {
    ContextId ctxId;
    uint8_t ringIdx;

    bool operator==(const FenceRingContextSpecific& other) const {
        return ctxId == other.ctxId && ringIdx == other.ringIdx;
    }
};
using FenceRing = std::variant<FenceRingGlobal, FenceRingContextSpecific>;

struct FenceRingHash {
    size_t operator()(const FenceRing& ring) const;
};

std::string to_string(const FenceRing& ring);

// Context id a fence ring belongs to, kNoContext for the global ring.
ContextId contextOf(const FenceRing& ring);

struct Fence {
    FenceId id = kInvalidFenceId;
    FenceRing ring = FenceRingGlobal{};
};

enum class FenceState { kPending, kSignaled };

struct FenceCompletion {
    FenceId id;
    FenceRing ring;
};

using FenceCompletionCallback = std::function<void(const FenceCompletion&)>;

}  // namespace gfxbroker
