// Copyright (C) 2023 The Android Open Source Project
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

#include "base/Metrics.h"

#include <memory>
#include <string>
#include <variant>

#include "host-common/logging.h"

namespace gfxbroker {
namespace base {

constexpr int64_t kBrokerAbortReason = 20001;
constexpr int64_t kBrokerInvariantViolation = 20002;
constexpr int64_t kBrokerFenceWaitTimeout = 20003;

void (*MetricsLogger::add_instant_event_callback)(int64_t event_code) = nullptr;
void (*MetricsLogger::add_instant_event_with_descriptor_callback)(int64_t event_code,
                                                                  int64_t descriptor) = nullptr;
void (*MetricsLogger::add_instant_event_with_metric_callback)(int64_t event_code,
                                                              int64_t metric_value) = nullptr;
void (*MetricsLogger::set_crash_annotation_callback)(const char* key, const char* value) = nullptr;

struct MetricTypeVisitor {
    void operator()(const std::monostate /*_*/) const { ERR("MetricEventType not initialized"); }

    void operator()(const BrokerAbort abort) const {
        // Make sure the event is reported before the process goes away.
        if (MetricsLogger::add_instant_event_with_descriptor_callback) {
            MetricsLogger::add_instant_event_with_descriptor_callback(kBrokerAbortReason,
                                                                      abort.abort_reason);
        }

        if (MetricsLogger::set_crash_annotation_callback) {
            MetricsLogger::set_crash_annotation_callback("gfxbroker_abort_file", abort.file);
            MetricsLogger::set_crash_annotation_callback("gfxbroker_abort_function",
                                                         abort.function);
            MetricsLogger::set_crash_annotation_callback("gfxbroker_abort_line",
                                                         std::to_string(abort.line).c_str());
            MetricsLogger::set_crash_annotation_callback(
                "gfxbroker_abort_code", std::to_string(abort.abort_reason).c_str());
            MetricsLogger::set_crash_annotation_callback("gfxbroker_abort_msg", abort.msg);
        }
    }

    void operator()(const BrokerInvariantViolation violation) const {
        ERR("Invariant violation at %s:%d (%s): %s [ctx %u fence %" PRIu64 "]", violation.file,
            violation.line, violation.function, violation.msg, violation.contextId,
            violation.fenceId);
        if (MetricsLogger::add_instant_event_with_descriptor_callback) {
            MetricsLogger::add_instant_event_with_descriptor_callback(
                kBrokerInvariantViolation, static_cast<int64_t>(violation.contextId));
        }
    }

    void operator()(const FenceWaitTimeout timeout) const {
        if (MetricsLogger::add_instant_event_with_metric_callback) {
            MetricsLogger::add_instant_event_with_metric_callback(kBrokerFenceWaitTimeout,
                                                                  timeout.waited_ms);
        }
    }
};

// MetricsLoggerImpl
class MetricsLoggerImpl : public MetricsLogger {
    void logMetricEvent(MetricEventType eventType) override {
        std::visit(MetricTypeVisitor(), eventType);
    }
};

std::unique_ptr<MetricsLogger> CreateMetricsLogger() {
    return std::make_unique<MetricsLoggerImpl>();
}

}  // namespace base
}  // namespace gfxbroker
