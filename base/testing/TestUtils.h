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

#ifndef GFXBROKER_BASE_TESTING_TESTUTILS_H_
#define GFXBROKER_BASE_TESTING_TESTUTILS_H_

#include <gmock/gmock.h>

#include <regex>
#include <string>

// Whole-string match, for log lines and printable names.
MATCHER_P(MatchesStdRegex, regStr, std::string("matches regular expression: ") + regStr) {
    std::regex reg(regStr);
    return std::regex_match(std::string(arg), reg);
}

MATCHER_P(ContainsStdRegex, regStr, std::string("contains regular expression: ") + regStr) {
    std::regex reg(regStr);
    return std::regex_search(std::string(arg), reg);
}

#endif  // GFXBROKER_BASE_TESTING_TESTUTILS_H_
