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

#include "context.hpp"
#include "error.hpp"
#include "init.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>

std::unique_ptr<clq_context>
clq_context::create(clq_driver* driver,
                    const std::vector<cl_device_id>& devices) {
    clq_init();

    clq_info("creating context on driver %s with %zu device(s)",
             driver->name(), devices.size());

    cl_int err;
    cl_context context = driver->create_context(
        static_cast<cl_uint>(devices.size()), devices.data(), &err);
    clq_check_status(err, "create context",
                     "devices: " + std::to_string(devices.size()));

    std::vector<clq_device> devs;
    for (auto dev : devices) {
        devs.emplace_back(driver, dev);
    }

    return std::unique_ptr<clq_context>(
        new clq_context(driver, context, std::move(devs)));
}

clq_context::clq_context(clq_driver* driver, cl_context context,
                         std::vector<clq_device>&& devices)
    : m_driver(driver), m_context(context), m_devices(std::move(devices)),
      m_released(false) {}

clq_context::~clq_context() {
    if (m_released) {
        return;
    }
    try {
        release();
    } catch (const clq_exception& e) {
        clq_error_fn("%s", e.what());
    }
}

void clq_context::check_live(const char* operation) const {
    if (m_released) {
        std::string msg = std::string("can not ") + operation + ": " +
                          to_string() + " has been released";
        clq_error("%s", msg.c_str());
        throw clq_resource_state_error(msg);
    }
}

std::unique_ptr<clq_command_queue>
clq_context::create_command_queue(const clq_device& device,
                                  clq_queue_mode_set modes) {
    check_live("create command queue");

    cl_int err;
    cl_command_queue queue = m_driver->create_command_queue(
        m_context, device.native(), modes.bits(), &err);
    clq_check_status(err, "create command queue",
                     device.to_string() + " modes: " + modes.to_string());

    std::unique_ptr<clq_command_queue> ret(
        new clq_command_queue(this, device, queue, modes));
    m_queues.push_back(ret.get());
    clq_debug_group(loggroup::refcounting, "created %s",
                    ret->to_string().c_str());
    return ret;
}

std::unique_ptr<clq_buffer>
clq_context::create_buffer(cl_mem_flags flags, size_t size, void* host_ptr) {
    check_live("create buffer");

    cl_int err;
    cl_mem mem =
        m_driver->create_buffer(m_context, flags, size, host_ptr, &err);
    clq_check_status(err, "create buffer", "size: " + std::to_string(size));
    clq_debug_group(loggroup::refcounting, "created buffer %p (%s)", mem,
                    pretty_size(size).c_str());

    return std::make_unique<clq_buffer>(this, mem, flags, size);
}

std::unique_ptr<clq_image2d>
clq_context::create_image2d(cl_mem_flags flags, const cl_image_format& format,
                            size_t width, size_t height, size_t row_pitch,
                            void* host_ptr) {
    check_live("create image2d");

    cl_image_desc desc = {};
    desc.image_type = CL_MEM_OBJECT_IMAGE2D;
    desc.image_width = width;
    desc.image_height = height;
    desc.image_depth = 1;
    desc.image_row_pitch = row_pitch;

    cl_int err;
    cl_mem mem = m_driver->create_image(m_context, flags, &format, &desc,
                                        host_ptr, &err);
    clq_check_status(err, "create image2d",
                     "width: " + std::to_string(width) +
                         " height: " + std::to_string(height));

    return std::make_unique<clq_image2d>(this, mem, flags, format, width,
                                         height, row_pitch);
}

std::unique_ptr<clq_image3d>
clq_context::create_image3d(cl_mem_flags flags, const cl_image_format& format,
                            size_t width, size_t height, size_t depth,
                            size_t row_pitch, size_t slice_pitch,
                            void* host_ptr) {
    check_live("create image3d");

    cl_image_desc desc = {};
    desc.image_type = CL_MEM_OBJECT_IMAGE3D;
    desc.image_width = width;
    desc.image_height = height;
    desc.image_depth = depth;
    desc.image_row_pitch = row_pitch;
    desc.image_slice_pitch = slice_pitch;

    cl_int err;
    cl_mem mem = m_driver->create_image(m_context, flags, &format, &desc,
                                        host_ptr, &err);
    clq_check_status(err, "create image3d",
                     "width: " + std::to_string(width) +
                         " height: " + std::to_string(height) +
                         " depth: " + std::to_string(depth));

    return std::make_unique<clq_image3d>(this, mem, flags, format, width,
                                         height, depth, row_pitch, slice_pitch);
}

std::unique_ptr<clq_kernel>
clq_context::create_kernel(cl_program program, const std::string& name) {
    check_live("create kernel");

    cl_int err;
    cl_kernel kernel = m_driver->create_kernel(program, name.c_str(), &err);
    clq_check_status(err, "create kernel", "name: " + name);

    return std::make_unique<clq_kernel>(this, kernel, name);
}

void clq_context::on_command_queue_released(clq_command_queue* queue) {
    auto it = std::find(m_queues.begin(), m_queues.end(), queue);
    if (it == m_queues.end()) {
        clq_warn_fn("%s is not tracked by %s", queue->to_string().c_str(),
                    to_string().c_str());
        return;
    }
    m_queues.erase(it);
}

void clq_context::release() {
    check_live("release context");

    // Releasing a queue removes it from m_queues
    auto queues = m_queues;
    for (auto queue : queues) {
        try {
            queue->release();
        } catch (const clq_exception& e) {
            clq_error_fn("%s", e.what());
        }
    }

    m_released = true;
    cl_int err = m_driver->release_context(m_context);
    clq_check_status(err, "release context", to_string());
}

std::string clq_context::to_string() const {
    return "context{" + pointer_to_string(m_context) +
           ", queues: " + std::to_string(m_queues.size()) + "}";
}
