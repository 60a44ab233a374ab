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

#include "event.hpp"
#include "config.hpp"
#include "error.hpp"
#include "init.hpp"
#include "log.hpp"

#include <stdexcept>

cl_int clq_event::status() const {
    cl_int status;
    cl_int err =
        m_driver->get_event_info(m_event, CL_EVENT_COMMAND_EXECUTION_STATUS,
                                 sizeof(status), &status, nullptr);
    clq_check_status(err, "query event status", to_string());
    return status;
}

cl_command_type clq_event::command_type() const {
    cl_command_type type;
    cl_int err = m_driver->get_event_info(m_event, CL_EVENT_COMMAND_TYPE,
                                          sizeof(type), &type, nullptr);
    clq_check_status(err, "query event command type", to_string());
    return type;
}

void clq_event::wait() const {
    clq_debug_group(loggroup::event, "clq_event::wait: event = %p", m_event);
    cl_int err = m_driver->wait_for_events(1, &m_event);
    clq_check_status(err, "wait for event", to_string());
}

uint64_t clq_event::profiling_info(cl_profiling_info pinfo) const {
    cl_ulong val;
    cl_int err = m_driver->get_event_profiling_info(m_event, pinfo,
                                                    sizeof(val), &val, nullptr);
    clq_check_status(err, "query event profiling info", to_string());
    return val;
}

std::string clq_event::to_string() const {
    return "event{" + pointer_to_string(m_event) + "}";
}

clq_event_list::clq_event_list(size_t capacity)
    : m_driver(nullptr), m_ids(capacity, nullptr), m_size(0) {
    if (capacity == 0) {
        throw std::invalid_argument("event list capacity must be at least 1");
    }
}

namespace {

size_t default_capacity() {
    clq_init();
    return config.event_list_default_capacity();
}

} // namespace

clq_event_list::clq_event_list() : clq_event_list(default_capacity()) {}

clq_event_list::~clq_event_list() { release(); }

clq_event clq_event_list::event(size_t index) const {
    if (index >= m_size) {
        throw std::out_of_range("event index " + std::to_string(index) +
                                " out of range in " + to_string());
    }
    return clq_event(m_driver, m_ids[index]);
}

void clq_event_list::release() {
    for (size_t i = 0; i < m_size; i++) {
        cl_int err = m_driver->release_event(m_ids[i]);
        if (err != CL_SUCCESS) {
            clq_warn_group_fn(loggroup::event, "could not release event %p: %s",
                              m_ids[i], cl_status_to_string(err));
        }
        m_ids[i] = nullptr;
    }
    m_size = 0;
}

cl_event* clq_event_list::reserve_slot(clq_driver* driver) {
    if (full()) {
        clq_error_group_fn(loggroup::event, "%s is full", to_string().c_str());
        throw clq_capacity_error("can not add event to full " + to_string(),
                                 capacity());
    }
    // All tokens in a list are released through the same driver
    CLQ_ASSERT(m_driver == nullptr || m_driver == driver);
    m_driver = driver;
    m_ids[m_size] = nullptr;
    return &m_ids[m_size];
}

void clq_event_list::commit_slot() {
    CLQ_ASSERT(!full());
    clq_debug_group(loggroup::event, "event list %p: new event %p at %zu",
                    this, m_ids[m_size], m_size);
    m_size++;
}

std::string clq_event_list::to_string() const {
    return "event_list{size: " + std::to_string(m_size) +
           ", capacity: " + std::to_string(capacity()) + "}";
}

std::string event_list_to_string(const clq_event_list* list) {
    if (list == nullptr) {
        return "none";
    }
    return list->to_string();
}
