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

#include "BrokerTypes.h"

#include <sstream>

namespace gfxbroker {

const char* toString(BrokerResult result) {
    switch (result) {
        case BrokerResult::kOk:
            return "Ok";
        case BrokerResult::kNotFound:
            return "NotFound";
        case BrokerResult::kAlreadyExists:
            return "AlreadyExists";
        case BrokerResult::kUnsupported:
            return "Unsupported";
        case BrokerResult::kInUse:
            return "InUse";
        case BrokerResult::kBackendFailure:
            return "BackendFailure";
        case BrokerResult::kInvalidArgument:
            return "InvalidArgument";
        case BrokerResult::kOutOfRange:
            return "OutOfRange";
        case BrokerResult::kInvariantViolation:
            return "InvariantViolation";
    }
    return "Unknown";
}

uint32_t virtioGpuResponseFor(BrokerResult result, ResponseScope scope) {
    switch (result) {
        case BrokerResult::kOk:
            return kVirtioGpuRespOkNodata;
        case BrokerResult::kNotFound:
            switch (scope) {
                case ResponseScope::kResource:
                    return kVirtioGpuRespErrInvalidResourceId;
                case ResponseScope::kContext:
                    return kVirtioGpuRespErrInvalidContextId;
                case ResponseScope::kScanout:
                    return kVirtioGpuRespErrInvalidScanoutId;
                case ResponseScope::kOther:
                    return kVirtioGpuRespErrInvalidParameter;
            }
            break;
        case BrokerResult::kOutOfRange:
            return scope == ResponseScope::kScanout ? kVirtioGpuRespErrInvalidScanoutId
                                                    : kVirtioGpuRespErrInvalidParameter;
        case BrokerResult::kInvalidArgument:
            return kVirtioGpuRespErrInvalidParameter;
        case BrokerResult::kAlreadyExists:
        case BrokerResult::kUnsupported:
        case BrokerResult::kInUse:
        case BrokerResult::kBackendFailure:
        case BrokerResult::kInvariantViolation:
            break;
    }
    return kVirtioGpuRespErrUnspec;
}

const char* toString(ComponentType type) {
    switch (type) {
        case ComponentType::k2D:
            return "2d";
        case ComponentType::kNativeRender:
            return "native-render";
        case ComponentType::kCrossDomain:
            return "cross-domain";
        case ComponentType::kStub:
            return "stub";
    }
    return "unknown";
}

size_t FenceRingHash::operator()(const FenceRing& ring) const {
    struct {
        size_t operator()(const FenceRingGlobal&) const { return 0; }
        size_t operator()(const FenceRingContextSpecific& ring) const {
            // Keep the global ring's hash out of the context-specific space.
            return ((static_cast<size_t>(ring.ctxId) << 8) | ring.ringIdx) + 1;
        }
    } visitor;
    return std::visit(visitor, ring);
}

std::string to_string(const FenceRing& ring) {
    struct {
        std::string operator()(const FenceRingGlobal&) const { return "global"; }
        std::string operator()(const FenceRingContextSpecific& ring) const {
            std::stringstream ss;
            ss << "context specific {ctx = " << ring.ctxId
               << ", ring = " << static_cast<uint32_t>(ring.ringIdx) << "}";
            return ss.str();
        }
    } visitor;
    return std::visit(visitor, ring);
}

ContextId contextOf(const FenceRing& ring) {
    if (const auto* specific = std::get_if<FenceRingContextSpecific>(&ring)) {
        return specific->ctxId;
    }
    return kNoContext;
}

}  // namespace gfxbroker
