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

#include "base/Metrics.h"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

namespace gfxbroker {
namespace base {
namespace {

std::vector<std::pair<int64_t, int64_t>> sDescriptorEvents;
std::vector<std::pair<int64_t, int64_t>> sMetricEvents;
std::map<std::string, std::string> sAnnotations;

class MetricsTest : public ::testing::Test {
   protected:
    void SetUp() override {
        sDescriptorEvents.clear();
        sMetricEvents.clear();
        sAnnotations.clear();
        MetricsLogger::add_instant_event_with_descriptor_callback = [](int64_t code,
                                                                       int64_t descriptor) {
            sDescriptorEvents.emplace_back(code, descriptor);
        };
        MetricsLogger::add_instant_event_with_metric_callback = [](int64_t code, int64_t value) {
            sMetricEvents.emplace_back(code, value);
        };
        MetricsLogger::set_crash_annotation_callback = [](const char* key, const char* value) {
            sAnnotations[key] = value;
        };
    }

    void TearDown() override {
        MetricsLogger::add_instant_event_with_descriptor_callback = nullptr;
        MetricsLogger::add_instant_event_with_metric_callback = nullptr;
        MetricsLogger::set_crash_annotation_callback = nullptr;
    }
};

TEST_F(MetricsTest, AbortIsAnnotated) {
    CreateMetricsLogger()->logMetricEvent(BrokerAbort{.file = "Broker.cpp",
                                                      .function = "build",
                                                      .msg = "no default backend",
                                                      .line = 42,
                                                      .abort_reason = -7});
    ASSERT_EQ(sDescriptorEvents.size(), 1u);
    EXPECT_EQ(sDescriptorEvents[0].second, -7);
    EXPECT_EQ(sAnnotations["gfxbroker_abort_file"], "Broker.cpp");
    EXPECT_EQ(sAnnotations["gfxbroker_abort_line"], "42");
    EXPECT_EQ(sAnnotations["gfxbroker_abort_msg"], "no default backend");
}

TEST_F(MetricsTest, InvariantViolationCarriesTheContext) {
    CreateMetricsLogger()->logMetricEvent(BrokerInvariantViolation{.file = "FenceHandler.cpp",
                                                                   .function = "signal",
                                                                   .msg = "foreign ring",
                                                                   .line = 7,
                                                                   .contextId = 3,
                                                                   .fenceId = 9});
    ASSERT_EQ(sDescriptorEvents.size(), 1u);
    EXPECT_EQ(sDescriptorEvents[0].second, 3);
    EXPECT_TRUE(sAnnotations.empty());
}

TEST_F(MetricsTest, FenceWaitTimeoutReportsDuration) {
    CreateMetricsLogger()->logMetricEvent(FenceWaitTimeout{.fenceId = 5, .waited_ms = 250});
    ASSERT_EQ(sMetricEvents.size(), 1u);
    EXPECT_EQ(sMetricEvents[0].second, 250);
}

TEST(MetricsNoCallbackTest, EventsWithoutCallbacksAreDropped) {
    CreateMetricsLogger()->logMetricEvent(FenceWaitTimeout{.fenceId = 1, .waited_ms = 1});
    CreateMetricsLogger()->logMetricEvent(MetricEventType{});
}

}  // namespace
}  // namespace base
}  // namespace gfxbroker
