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

#include "BrokerTypes.h"

namespace gfxbroker {

// Sum of iovec lengths. Saturates at SIZE_MAX.
size_t iovecsTotalSize(const iovec* iovs, size_t numIovs);
size_t iovecsTotalSize(const IovecList& iovs);

// Copies bytes between a linear buffer and a scatter list, starting at the given byte offset into
// the scatter list. Returns false without copying anything if the range does not fit.
bool copyFromIovecs(const IovecList& iovs, uint64_t offset, void* dst, size_t size);
bool copyToIovecs(const IovecList& iovs, uint64_t offset, const void* src, size_t size);

// Describes a rectangle copy between guest memory laid out with guestStride starting at
// guestOffset and a packed host image of hostWidth pixels per row.
struct Transfer2D {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t w = 0;
    uint32_t h = 0;
    uint32_t bpp = 4;
    uint32_t hostWidth = 0;
    uint32_t hostHeight = 0;
    uint32_t guestStride = 0;
    uint64_t guestOffset = 0;
};

// Row by row copy. Rejects rectangles outside the host image and guest ranges outside the
// iovecs with kInvalidArgument.
BrokerResult transfer2DToHost(const Transfer2D& xfer, const IovecList& guest, uint8_t* host,
                              size_t hostSize);
BrokerResult transfer2DFromHost(const Transfer2D& xfer, const uint8_t* host, size_t hostSize,
                                const IovecList& guest);

}  // namespace gfxbroker
