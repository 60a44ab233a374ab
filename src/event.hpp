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

#include "cl_headers.hpp"
#include "driver.hpp"
#include "utils.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct clq_command_queue;

// View of one completion token held by an event list. It does not own the
// token and is only valid while the list that produced it holds it.
struct clq_event {

    clq_event(clq_driver* driver, cl_event event)
        : m_driver(driver), m_event(event) {}

    cl_event native() const { return m_event; }

    cl_int status() const;

    bool completed() const { return status() == CL_COMPLETE; }

    bool terminated() const { return status() < 0; }

    cl_command_type command_type() const;

    // Block until the command has completed.
    void wait() const;

    // Device timestamp in nanoseconds. Only available for commands enqueued
    // on a queue with profiling enabled.
    uint64_t profiling_info(cl_profiling_info pinfo) const;

    std::string to_string() const;

private:
    clq_driver* m_driver;
    cl_event m_event;
};

// Bounded, append-only sequence of completion tokens.
//
// As the output argument of an enqueue operation, a list receives exactly
// one new token per successful call. As a condition argument, its tokens
// are the dependencies of the new command and the list is only read.
//
// The capacity is fixed at construction. A command whose output list is
// full is rejected with clq_capacity_error before it is submitted.
//
// Lists are not thread-safe.
struct clq_event_list {

    explicit clq_event_list(size_t capacity);

    // Build a list with the configured default capacity.
    clq_event_list();

    ~clq_event_list();

    clq_event_list(const clq_event_list&) = delete;
    clq_event_list& operator=(const clq_event_list&) = delete;

    size_t size() const { return m_size; }
    size_t capacity() const { return m_ids.size(); }
    bool empty() const { return m_size == 0; }
    bool full() const { return m_size == m_ids.size(); }

    // Contiguous native tokens, valid for indices [0, size()).
    const cl_event* ids() const { return m_ids.data(); }

    // Throws std::out_of_range for index >= size().
    clq_event event(size_t index) const;
    clq_event operator[](size_t index) const { return event(index); }

    const cl_event* begin() const { return m_ids.data(); }
    const cl_event* end() const { return m_ids.data() + m_size; }

    // Release every token and empty the list. The capacity is unchanged.
    void release();

    std::string to_string() const;

private:
    friend struct clq_command_queue;

    // Return the slot the driver should write the next token to.
    CHECK_RETURN cl_event* reserve_slot(clq_driver* driver);

    // Account for the token written to the reserved slot.
    void commit_slot();

    clq_driver* m_driver;
    std::vector<cl_event> m_ids;
    size_t m_size;
};

// Render an optional list for diagnostics.
std::string event_list_to_string(const clq_event_list* list);
