// Copyright 2024 The clq authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "log.hpp"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <string>

#ifndef _MSC_VER
#define CHECK_RETURN __attribute__((warn_unused_result))
#else
#define CHECK_RETURN
#endif

#define CLQ_ASSERT(cond) assert(cond)

// Return a "{a, b, c}" rendering of the first `count` values of `vals`, or
// "null" when `vals` is null.
static inline std::string vector_to_string(const size_t* vals,
                                           unsigned count) {
    if (vals == nullptr) {
        return "null";
    }
    std::string str = "{";
    for (unsigned i = 0; i < count; i++) {
        str += std::to_string(vals[i]);
        if (i != count - 1) {
            str += ", ";
        }
    }
    return str + "}";
}

static inline std::string pointer_to_string(const void* ptr) {
    char buf[2 + sizeof(uintptr_t) * 2 + 1];
    snprintf(buf, sizeof(buf), "%p", ptr);
    return buf;
}
