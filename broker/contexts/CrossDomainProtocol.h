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

#include <cstddef>
#include <cstdint>

namespace gfxbroker {

// Guest <-> host layout of the cross-domain command stream and replies.

constexpr uint32_t kCrossDomainCapsetVersion = 1;

constexpr uint8_t kCrossDomainCmdInit = 1;
constexpr uint8_t kCrossDomainCmdGetImageRequirements = 2;
constexpr uint8_t kCrossDomainCmdPoll = 3;
constexpr uint8_t kCrossDomainCmdSend = 4;
constexpr uint8_t kCrossDomainCmdReceive = 5;
constexpr uint8_t kCrossDomainCmdRead = 6;
constexpr uint8_t kCrossDomainCmdWrite = 7;

constexpr uint8_t kCrossDomainQueryRing = 0;
constexpr uint8_t kCrossDomainChannelRing = 1;

constexpr uint32_t kCrossDomainChannelTypeWayland = 1;
constexpr uint32_t kCrossDomainChannelTypeCameraStub = 2;

constexpr uint32_t kCrossDomainIdTypeVirtgpuBlob = 1;
constexpr uint32_t kCrossDomainIdTypeWritePipe = 2;
constexpr uint32_t kCrossDomainIdTypeReadPipe = 3;

constexpr uint32_t kCrossDomainMaxIdentifiers = 4;

// Read pipe ids are allocated above this value so the guest can predict them.
constexpr uint32_t kCrossDomainPipeReadStart = 0x80000000;

constexpr size_t kCrossDomainDefaultBufferSize = 4096;

struct CrossDomainCapabilities {
    uint32_t version;
    uint32_t supported_channels;
    uint32_t supports_dmabuf;
    uint32_t supports_external_gpu_memory;
};

struct CrossDomainHeader {
    uint8_t cmd;
    uint8_t fence_ctx_idx;
    uint16_t cmd_size;
    uint32_t pad;
};

struct CrossDomainInit {
    CrossDomainHeader hdr;
    uint32_t query_ring_id;
    uint32_t channel_ring_id;
    uint32_t channel_type;
};

// Older guests send INIT without a channel ring and use the query ring for both.
struct CrossDomainInitLegacy {
    CrossDomainHeader hdr;
    uint32_t query_ring_id;
    uint32_t channel_type;
};

struct CrossDomainGetImageRequirements {
    CrossDomainHeader hdr;
    uint32_t width;
    uint32_t height;
    uint32_t drm_format;
    uint32_t flags;
};

struct CrossDomainImageRequirements {
    uint32_t strides[4];
    uint32_t offsets[4];
    uint64_t modifier;
    uint64_t size;
    uint32_t blob_id;
    uint32_t map_info;
    int32_t memory_idx;
    int32_t physical_device_idx;
};

// SEND from the guest, RECEIVE towards it. Opaque data follows the struct.
struct CrossDomainSendReceive {
    CrossDomainHeader hdr;
    uint32_t num_identifiers;
    uint32_t opaque_data_size;
    uint32_t identifiers[kCrossDomainMaxIdentifiers];
    uint32_t identifier_types[kCrossDomainMaxIdentifiers];
    uint32_t identifier_sizes[kCrossDomainMaxIdentifiers];
};

// WRITE from the guest into a write pipe, READ towards it from a read pipe.
struct CrossDomainReadWrite {
    CrossDomainHeader hdr;
    uint32_t identifier;
    uint32_t hang_up;
    uint32_t opaque_data_size;
    uint32_t pad;
};

constexpr size_t kCrossDomainMaxSendReceiveSize =
    kCrossDomainDefaultBufferSize - sizeof(CrossDomainSendReceive);
constexpr size_t kCrossDomainMaxReadWriteSize =
    kCrossDomainDefaultBufferSize - sizeof(CrossDomainReadWrite);

static_assert(sizeof(CrossDomainCapabilities) == 16);
static_assert(sizeof(CrossDomainHeader) == 8);
static_assert(sizeof(CrossDomainInit) == 20);
static_assert(sizeof(CrossDomainInitLegacy) == 16);
static_assert(sizeof(CrossDomainGetImageRequirements) == 24);
static_assert(sizeof(CrossDomainImageRequirements) == 64);
static_assert(sizeof(CrossDomainSendReceive) == 64);
static_assert(sizeof(CrossDomainReadWrite) == 24);

}  // namespace gfxbroker
