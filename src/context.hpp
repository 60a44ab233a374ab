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
#include "device.hpp"
#include "driver.hpp"
#include "kernel.hpp"
#include "memory.hpp"
#include "queue.hpp"

#include <memory>
#include <string>
#include <vector>

// A native context and the factory for everything created in it.
//
// The context keeps track of the command queues created from it. Releasing
// or destroying the context releases every queue that is still live. The
// driver must outlive the context and every object created from it.
struct clq_context {

    // Create a context for the given devices. Initialises the library on
    // first use.
    static std::unique_ptr<clq_context>
    create(clq_driver* driver, const std::vector<cl_device_id>& devices);

    ~clq_context();

    clq_context(const clq_context&) = delete;
    clq_context& operator=(const clq_context&) = delete;

    clq_driver* driver() const { return m_driver; }
    cl_context native() const { return m_context; }
    const std::vector<clq_device>& devices() const { return m_devices; }

    std::unique_ptr<clq_command_queue>
    create_command_queue(const clq_device& device,
                         clq_queue_mode_set modes = {});

    std::unique_ptr<clq_buffer> create_buffer(cl_mem_flags flags, size_t size,
                                              void* host_ptr = nullptr);

    std::unique_ptr<clq_image2d>
    create_image2d(cl_mem_flags flags, const cl_image_format& format,
                   size_t width, size_t height, size_t row_pitch = 0,
                   void* host_ptr = nullptr);

    std::unique_ptr<clq_image3d>
    create_image3d(cl_mem_flags flags, const cl_image_format& format,
                   size_t width, size_t height, size_t depth,
                   size_t row_pitch = 0, size_t slice_pitch = 0,
                   void* host_ptr = nullptr);

    // Create a kernel from a program built by the caller.
    std::unique_ptr<clq_kernel> create_kernel(cl_program program,
                                              const std::string& name);

    // Live command queues, in creation order.
    const std::vector<clq_command_queue*>& command_queues() const {
        return m_queues;
    }

    // Release every live queue, then the native context.
    void release();
    bool is_released() const { return m_released; }

    std::string to_string() const;

private:
    friend struct clq_command_queue;

    clq_context(clq_driver* driver, cl_context context,
                std::vector<clq_device>&& devices);

    void check_live(const char* operation) const;

    void on_command_queue_released(clq_command_queue* queue);

    clq_driver* m_driver;
    cl_context m_context;
    std::vector<clq_device> m_devices;
    std::vector<clq_command_queue*> m_queues;
    bool m_released;
};
