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

#include <cstdio>

#ifdef _MSC_VER
#define GFXBROKER_LOG(file, prefix, fmt, ...) \
    fprintf(file, "%s %s:%d:%s: " fmt "\n", prefix, __FILE__, __LINE__, __func__, __VA_ARGS__)
#elif defined(__GNUC__) || defined(__clang__)
#define GFXBROKER_LOG(file, prefix, fmt, ...) \
    fprintf(file, "%s %s:%d:%s: " fmt "\n", prefix, __FILE__, __LINE__, __func__, ##__VA_ARGS__)
#else
#define GFXBROKER_LOG(...) ((void)0)
#endif

//#define ENABLE_BROKER_LOG 1
#if defined(ENABLE_BROKER_LOG)
#define BROKER_DEBUG_LOG(...) GFXBROKER_LOG(stderr, "D", __VA_ARGS__)
#else
#define BROKER_DEBUG_LOG(...) ((void)0)
#endif

//#define ENABLE_FENCE_LOG 1
#if defined(ENABLE_FENCE_LOG)
#define FENCE_DEBUG_LOG(...) GFXBROKER_LOG(stderr, "D", __VA_ARGS__)
#else
#define FENCE_DEBUG_LOG(...) ((void)0)
#endif

#define ERR(...)                                 \
    do {                                         \
        GFXBROKER_LOG(stderr, "E", __VA_ARGS__); \
        fflush(stderr);                          \
    } while (0)

#define INFO(...)                                \
    do {                                         \
        GFXBROKER_LOG(stdout, "I", __VA_ARGS__); \
        fflush(stdout);                          \
    } while (0)

#ifndef GFXBROKER_FATAL
#define GFXBROKER_FATAL() abort();
#endif
