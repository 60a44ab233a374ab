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

#include <array>

// Native argument storage reused by every command a queue enqueues: three
// coordinate triples and one object handle slot.
//
// Values are stored right-aligned: writing N values fills the last N slots
// of a triple and returns a pointer to the first of them, so that the
// driver reads exactly N values from the returned position. Each write
// overwrites everything the following driver call reads; nothing else about
// the contents is guaranteed between calls.
//
// A scratch object belongs to exactly one command queue and is not
// thread-safe.
struct clq_scratch {

    enum slot : unsigned
    {
        slot_a = 0,
        slot_b = 1,
        slot_c = 2,
    };

    clq_scratch() : m_coords{}, m_handles{} {}

    clq_scratch(const clq_scratch&) = delete;
    clq_scratch& operator=(const clq_scratch&) = delete;

    const size_t* put(slot s, size_t x) {
        auto& coords = m_coords[s];
        coords[2] = x;
        return &coords[2];
    }

    const size_t* put(slot s, size_t x, size_t y) {
        auto& coords = m_coords[s];
        coords[1] = x;
        coords[2] = y;
        return &coords[1];
    }

    const size_t* put(slot s, size_t x, size_t y, size_t z) {
        auto& coords = m_coords[s];
        coords[0] = x;
        coords[1] = y;
        coords[2] = z;
        return &coords[0];
    }

    const cl_mem* put_handle(cl_mem handle) {
        m_handles[0] = handle;
        return m_handles.data();
    }

    const std::array<size_t, 3>& coords(slot s) const { return m_coords[s]; }

private:
    std::array<std::array<size_t, 3>, 3> m_coords;
    std::array<cl_mem, 1> m_handles;
};
