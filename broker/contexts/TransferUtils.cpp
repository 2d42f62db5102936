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

#include "TransferUtils.h"

#include <algorithm>
#include <cstring>
#include <limits>

#include "host-common/logging.h"

namespace gfxbroker {
namespace {

enum IovSyncDir {
    IOV_TO_LINEAR = 0,
    LINEAR_TO_IOV = 1,
};

// Copies [start, start + length) of the scatter list to or from linear.
bool sync_iov(const IovecList& iovs, uint64_t start, uint8_t* linear, size_t length,
              IovSyncDir dir) {
    const size_t total = iovecsTotalSize(iovs);
    if (start > total || length > total - start) {
        BROKER_DEBUG_LOG("range [%llu, +%zu) overflows iovecs of %zu bytes",
                         static_cast<unsigned long long>(start), length, total);
        return false;
    }

    const uint64_t end = start + length;
    uint64_t iovOffset = 0;
    size_t written = 0;
    for (size_t iovIndex = 0; iovIndex < iovs.size() && written < length; ++iovIndex) {
        uint8_t* iovBase = static_cast<uint8_t*>(iovs[iovIndex].iov_base);
        const uint64_t iovLen = iovs[iovIndex].iov_len;
        const uint64_t iovOffsetEnd = iovOffset + iovLen;

        const uint64_t lowerIntersect = std::max(iovOffset, start);
        const uint64_t upperIntersect = std::min(iovOffsetEnd, end);
        if (lowerIntersect < upperIntersect) {
            const size_t toCopy = static_cast<size_t>(upperIntersect - lowerIntersect);
            uint8_t* iovPtr = iovBase + (lowerIntersect - iovOffset);
            uint8_t* linearPtr = linear + (lowerIntersect - start);
            switch (dir) {
                case IOV_TO_LINEAR:
                    memcpy(linearPtr, iovPtr, toCopy);
                    break;
                case LINEAR_TO_IOV:
                    memcpy(iovPtr, linearPtr, toCopy);
                    break;
            }
            written += toCopy;
        }
        iovOffset = iovOffsetEnd;
    }
    return written == length;
}

BrokerResult transfer2D(const Transfer2D& xfer, const IovecList& guest, uint8_t* host,
                        size_t hostSize, IovSyncDir dir) {
    if (xfer.w == 0 || xfer.h == 0) {
        return BrokerResult::kOk;
    }
    if (xfer.bpp == 0 || xfer.x > xfer.hostWidth || xfer.w > xfer.hostWidth - xfer.x ||
        xfer.y > xfer.hostHeight || xfer.h > xfer.hostHeight - xfer.y) {
        ERR("box %ux%u+%u+%u outside of %ux%u resource", xfer.w, xfer.h, xfer.x, xfer.y,
            xfer.hostWidth, xfer.hostHeight);
        return BrokerResult::kInvalidArgument;
    }

    const uint64_t hostStride = static_cast<uint64_t>(xfer.hostWidth) * xfer.bpp;
    const uint64_t rowBytes = static_cast<uint64_t>(xfer.w) * xfer.bpp;
    const uint64_t guestStride = xfer.guestStride ? xfer.guestStride : hostStride;
    if (guestStride < rowBytes) {
        ERR("guest stride %llu shorter than a %llu byte row",
            static_cast<unsigned long long>(guestStride),
            static_cast<unsigned long long>(rowBytes));
        return BrokerResult::kInvalidArgument;
    }
    if (hostStride * xfer.hostHeight > hostSize) {
        ERR("host image of %zu bytes is smaller than %ux%u", hostSize, xfer.hostWidth,
            xfer.hostHeight);
        return BrokerResult::kInvalidArgument;
    }

    // The last row does not occupy the full stride.
    const uint64_t guestSpan = guestStride * (xfer.h - 1) + rowBytes;
    const size_t guestTotal = iovecsTotalSize(guest);
    if (xfer.guestOffset > guestTotal || guestSpan > guestTotal - xfer.guestOffset) {
        ERR("transfer of %llu bytes at offset %llu overflows %zu bytes of backing",
            static_cast<unsigned long long>(guestSpan),
            static_cast<unsigned long long>(xfer.guestOffset), guestTotal);
        return BrokerResult::kInvalidArgument;
    }

    for (uint32_t row = 0; row < xfer.h; ++row) {
        const uint64_t guestRow = xfer.guestOffset + guestStride * row;
        uint8_t* hostRow =
            host + hostStride * (xfer.y + row) + static_cast<uint64_t>(xfer.x) * xfer.bpp;
        if (!sync_iov(guest, guestRow, hostRow, static_cast<size_t>(rowBytes), dir)) {
            return BrokerResult::kInvalidArgument;
        }
    }
    return BrokerResult::kOk;
}

}  // namespace

size_t iovecsTotalSize(const iovec* iovs, size_t numIovs) {
    size_t total = 0;
    for (size_t i = 0; i < numIovs; ++i) {
        if (iovs[i].iov_len > std::numeric_limits<size_t>::max() - total) {
            return std::numeric_limits<size_t>::max();
        }
        total += iovs[i].iov_len;
    }
    return total;
}

size_t iovecsTotalSize(const IovecList& iovs) { return iovecsTotalSize(iovs.data(), iovs.size()); }

bool copyFromIovecs(const IovecList& iovs, uint64_t offset, void* dst, size_t size) {
    return sync_iov(iovs, offset, static_cast<uint8_t*>(dst), size, IOV_TO_LINEAR);
}

bool copyToIovecs(const IovecList& iovs, uint64_t offset, const void* src, size_t size) {
    // LINEAR_TO_IOV only reads from the linear side.
    return sync_iov(iovs, offset, static_cast<uint8_t*>(const_cast<void*>(src)), size,
                    LINEAR_TO_IOV);
}

BrokerResult transfer2DToHost(const Transfer2D& xfer, const IovecList& guest, uint8_t* host,
                              size_t hostSize) {
    return transfer2D(xfer, guest, host, hostSize, IOV_TO_LINEAR);
}

BrokerResult transfer2DFromHost(const Transfer2D& xfer, const uint8_t* host, size_t hostSize,
                                const IovecList& guest) {
    return transfer2D(xfer, guest, const_cast<uint8_t*>(host), hostSize, LINEAR_TO_IOV);
}

}  // namespace gfxbroker
