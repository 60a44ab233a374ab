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

#include <cstdint>
#include <string>

#include "cl_headers.hpp"

enum loglevel
{
    fatal = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

enum loggroup : uint64_t
{
    refcounting = (1ULL << 0),
    api = (1ULL << 1),
    event = (1ULL << 2),
    cfg = (1ULL << 3),
    none = (1ULL << 63),
    all = ~0ULL
};

#ifndef _MSC_VER
#define CHECK_PRINTF(index, first) __attribute__((format(printf, index, first)))
#else
#define CHECK_PRINTF(index, first)
#endif

void init_logging();
void term_logging();
void clq_log(uint64_t group_mask, loglevel level, const char* fmt, ...)
    CHECK_PRINTF(3, 4);
bool clq_log_level_enabled(loglevel level);
bool clq_log_group_enabled(uint64_t group_mask);

#define clq_fatal(fmt, ...)                                                    \
    clq_log(loggroup::none, loglevel::fatal, fmt "\n", ##__VA_ARGS__)
#define clq_error(fmt, ...)                                                    \
    clq_log(loggroup::none, loglevel::error, fmt "\n", ##__VA_ARGS__)
#define clq_warn(fmt, ...)                                                     \
    clq_log(loggroup::none, loglevel::warn, fmt "\n", ##__VA_ARGS__)
#define clq_info(fmt, ...)                                                     \
    clq_log(loggroup::none, loglevel::info, fmt "\n", ##__VA_ARGS__)
#define clq_debug(fmt, ...)                                                    \
    clq_log(loggroup::none, loglevel::debug, fmt "\n", ##__VA_ARGS__)

#define clq_fatal_fn(fmt, ...) clq_fatal("%s: " fmt, __func__, ##__VA_ARGS__)
#define clq_error_fn(fmt, ...) clq_error("%s: " fmt, __func__, ##__VA_ARGS__)
#define clq_warn_fn(fmt, ...) clq_warn("%s: " fmt, __func__, ##__VA_ARGS__)
#define clq_info_fn(fmt, ...) clq_info("%s: " fmt, __func__, ##__VA_ARGS__)
#define clq_debug_fn(fmt, ...) clq_debug("%s: " fmt, __func__, ##__VA_ARGS__)

#define clq_fatal_group(mask, fmt, ...)                                        \
    clq_log(mask, loglevel::fatal, fmt "\n", ##__VA_ARGS__)
#define clq_error_group(mask, fmt, ...)                                        \
    clq_log(mask, loglevel::error, fmt "\n", ##__VA_ARGS__)
#define clq_warn_group(mask, fmt, ...)                                         \
    clq_log(mask, loglevel::warn, fmt "\n", ##__VA_ARGS__)
#define clq_info_group(mask, fmt, ...)                                         \
    clq_log(mask, loglevel::info, fmt "\n", ##__VA_ARGS__)
#define clq_debug_group(mask, fmt, ...)                                        \
    clq_log(mask, loglevel::debug, fmt "\n", ##__VA_ARGS__)

#define clq_error_group_fn(mask, fmt, ...)                                     \
    clq_error_group(mask, "%s: " fmt, __func__, ##__VA_ARGS__)
#define clq_warn_group_fn(mask, fmt, ...)                                      \
    clq_warn_group(mask, "%s: " fmt, __func__, ##__VA_ARGS__)
#define clq_info_group_fn(mask, fmt, ...)                                      \
    clq_info_group(mask, "%s: " fmt, __func__, ##__VA_ARGS__)
#define clq_debug_group_fn(mask, fmt, ...)                                     \
    clq_debug_group(mask, "%s: " fmt, __func__, ##__VA_ARGS__)

std::string pretty_size(uint64_t size);

const char* cl_status_to_string(cl_int status);
