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

#include "queue.hpp"
#include "config.hpp"
#include "context.hpp"
#include "error.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

// Arguments are only rendered when API calls are logged
#define LOG_QUEUE_CALL(fmt, ...)                                               \
    do {                                                                       \
        if (clq_log_level_enabled(loglevel::debug) &&                          \
            clq_log_group_enabled(loggroup::api)) {                            \
            clq_debug_group_fn(loggroup::api, "queue = %p, " fmt, m_queue,     \
                               ##__VA_ARGS__);                                 \
        }                                                                      \
    } while (0)

namespace {

cl_uint num_conditions(const clq_condition_list& condition) {
    if (!condition) {
        return 0;
    }
    return static_cast<cl_uint>(condition->get().size());
}

const cl_event* conditions(const clq_condition_list& condition) {
    if (!condition || condition->get().empty()) {
        return nullptr;
    }
    return condition->get().ids();
}

cl_bool to_cl_bool(bool value) { return value ? CL_TRUE : CL_FALSE; }

std::string offset_to_string(size_t offset, size_t size) {
    return "offset: " + std::to_string(offset) +
           " size: " + std::to_string(size);
}

} // namespace

const char* queue_mode_to_string(clq_queue_mode mode) {
    switch (mode) {
    case clq_queue_mode::out_of_order:
        return "out_of_order";
    case clq_queue_mode::profiling:
        return "profiling";
    }
    return "unknown";
}

static const clq_queue_mode gQueueModes[] = {
    clq_queue_mode::out_of_order,
    clq_queue_mode::profiling,
};

clq_queue_mode_set::clq_queue_mode_set(
    std::initializer_list<clq_queue_mode> modes)
    : m_bits(0) {
    for (auto mode : modes) {
        set(mode, true);
    }
}

clq_queue_mode_set
clq_queue_mode_set::from_bitfield(cl_command_queue_properties bits) {
    clq_queue_mode_set set;
    for (auto mode : gQueueModes) {
        if ((bits & static_cast<cl_command_queue_properties>(mode)) != 0) {
            set.set(mode, true);
        }
    }
    return set;
}

std::optional<clq_queue_mode>
clq_queue_mode_set::mode_from_value(cl_command_queue_properties value) {
    for (auto mode : gQueueModes) {
        if (value == static_cast<cl_command_queue_properties>(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

void clq_queue_mode_set::set(clq_queue_mode mode, bool enabled) {
    auto bit = static_cast<cl_command_queue_properties>(mode);
    if (enabled) {
        m_bits |= bit;
    } else {
        m_bits &= ~bit;
    }
}

std::string clq_queue_mode_set::to_string() const {
    std::string str = "{";
    bool first = true;
    for (auto mode : gQueueModes) {
        if (contains(mode)) {
            if (!first) {
                str += ", ";
            }
            str += queue_mode_to_string(mode);
            first = false;
        }
    }
    return str + "}";
}

clq_command_queue::clq_command_queue(clq_context* ctx,
                                     const clq_device& device,
                                     cl_command_queue queue,
                                     clq_queue_mode_set properties)
    : m_context(ctx), m_driver(ctx->driver()), m_device(device),
      m_queue(queue), m_properties(properties), m_released(false) {}

clq_command_queue::~clq_command_queue() {
    if (m_released) {
        return;
    }
    try {
        release();
    } catch (const clq_exception& e) {
        clq_error_fn("%s", e.what());
    }
}

void clq_command_queue::check_live(const char* operation) const {
    if (m_released) {
        std::string msg = std::string("can not ") + operation + ": " +
                          to_string() + " has been released";
        clq_error("%s", msg.c_str());
        throw clq_resource_state_error(msg);
    }
}

cl_event* clq_command_queue::reserve_event(const clq_output_list& events) {
    if (!events) {
        return nullptr;
    }
    return events->get().reserve_slot(m_driver);
}

void clq_command_queue::commit_event(const clq_output_list& events) {
    if (events) {
        events->get().commit_slot();
    }
}

void clq_command_queue::command_failed(cl_int err, const char* operation,
                                       const std::string& operands,
                                       const clq_condition_list& condition,
                                       const clq_output_list& events) const {
    std::string details = operands;
    details += " cond.: ";
    details += event_list_to_string(condition ? &condition->get() : nullptr);
    details += " events: ";
    details += event_list_to_string(events ? &events->get() : nullptr);
    clq_check_status(err, operation, details);
}

//
// Buffers
//

clq_command_queue& clq_command_queue::write_buffer(
    const clq_buffer& buffer, bool blocking, const void* ptr,
    clq_condition_list condition, clq_output_list events) {
    return write_buffer(buffer, blocking, 0, buffer.size(), ptr, condition,
                        events);
}

clq_command_queue& clq_command_queue::write_buffer(
    const clq_buffer& buffer, bool blocking, size_t offset, size_t size,
    const void* ptr, clq_condition_list condition, clq_output_list events) {
    LOG_QUEUE_CALL("buffer = %p, blocking = %d, offset = %zu, size = %zu, "
                   "ptr = %p",
                   buffer.native(), blocking, offset, size, ptr);
    check_live("write buffer");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_write_buffer(
        m_queue, buffer.native(), to_cl_bool(blocking), offset, size, ptr,
        num_conditions(condition), conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "write buffer",
                       buffer.to_string() + " " +
                           offset_to_string(offset, size),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::read_buffer(const clq_buffer& buffer,
                                                  bool blocking, void* ptr,
                                                  clq_condition_list condition,
                                                  clq_output_list events) {
    return read_buffer(buffer, blocking, 0, buffer.size(), ptr, condition,
                       events);
}

clq_command_queue& clq_command_queue::read_buffer(
    const clq_buffer& buffer, bool blocking, size_t offset, size_t size,
    void* ptr, clq_condition_list condition, clq_output_list events) {
    LOG_QUEUE_CALL("buffer = %p, blocking = %d, offset = %zu, size = %zu, "
                   "ptr = %p",
                   buffer.native(), blocking, offset, size, ptr);
    check_live("read buffer");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_read_buffer(
        m_queue, buffer.native(), to_cl_bool(blocking), offset, size, ptr,
        num_conditions(condition), conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "read buffer",
                       buffer.to_string() + " " +
                           offset_to_string(offset, size),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::copy_buffer(const clq_buffer& src,
                                                  const clq_buffer& dst,
                                                  clq_condition_list condition,
                                                  clq_output_list events) {
    return copy_buffer(src, dst, 0, 0, src.size(), condition, events);
}

clq_command_queue& clq_command_queue::copy_buffer(
    const clq_buffer& src, const clq_buffer& dst, size_t src_offset,
    size_t dst_offset, size_t size, clq_condition_list condition,
    clq_output_list events) {
    LOG_QUEUE_CALL("src = %p, dst = %p, src_offset = %zu, dst_offset = %zu, "
                   "size = %zu",
                   src.native(), dst.native(), src_offset, dst_offset, size);
    check_live("copy buffer");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_copy_buffer(
        m_queue, src.native(), dst.native(), src_offset, dst_offset, size,
        num_conditions(condition), conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "copy buffer",
                       "from " + src.to_string() + " to " + dst.to_string() +
                           " src_offset: " + std::to_string(src_offset) +
                           " dst_offset: " + std::to_string(dst_offset) +
                           " size: " + std::to_string(size),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

//
// Image transfers
//

clq_command_queue& clq_command_queue::enqueue_write_image(
    const clq_image& image, bool blocking, const size_t* origin,
    const size_t* region, size_t row_pitch, size_t slice_pitch,
    const void* ptr, const clq_condition_list& condition,
    const clq_output_list& events) {
    LOG_QUEUE_CALL("image = %p, blocking = %d, origin = %s, region = %s, "
                   "row_pitch = %zu, slice_pitch = %zu, ptr = %p",
                   image.native(), blocking,
                   vector_to_string(origin, 3).c_str(),
                   vector_to_string(region, 3).c_str(), row_pitch,
                   slice_pitch, ptr);
    check_live("write image");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_write_image(
        m_queue, image.native(), to_cl_bool(blocking), origin, region,
        row_pitch, slice_pitch, ptr, num_conditions(condition),
        conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "write image",
                       image.to_string() +
                           " origin: " + vector_to_string(origin, 3) +
                           " region: " + vector_to_string(region, 3) +
                           " row_pitch: " + std::to_string(row_pitch) +
                           " slice_pitch: " + std::to_string(slice_pitch),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::enqueue_read_image(
    const clq_image& image, bool blocking, const size_t* origin,
    const size_t* region, size_t row_pitch, size_t slice_pitch, void* ptr,
    const clq_condition_list& condition, const clq_output_list& events) {
    LOG_QUEUE_CALL("image = %p, blocking = %d, origin = %s, region = %s, "
                   "row_pitch = %zu, slice_pitch = %zu, ptr = %p",
                   image.native(), blocking,
                   vector_to_string(origin, 3).c_str(),
                   vector_to_string(region, 3).c_str(), row_pitch,
                   slice_pitch, ptr);
    check_live("read image");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_read_image(
        m_queue, image.native(), to_cl_bool(blocking), origin, region,
        row_pitch, slice_pitch, ptr, num_conditions(condition),
        conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "read image",
                       image.to_string() +
                           " origin: " + vector_to_string(origin, 3) +
                           " region: " + vector_to_string(region, 3) +
                           " row_pitch: " + std::to_string(row_pitch) +
                           " slice_pitch: " + std::to_string(slice_pitch),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::write_image(const clq_image2d& image,
                                                  bool blocking,
                                                  const void* ptr,
                                                  clq_condition_list condition,
                                                  clq_output_list events) {
    return write_image(image, blocking, 0, 0, 0, image.width(), image.height(),
                       ptr, condition, events);
}

clq_command_queue& clq_command_queue::write_image(
    const clq_image2d& image, bool blocking, size_t row_pitch,
    size_t origin_x, size_t origin_y, size_t width, size_t height,
    const void* ptr, clq_condition_list condition, clq_output_list events) {
    auto origin = m_scratch.put(clq_scratch::slot_a, origin_x, origin_y, 0);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, 1);
    return enqueue_write_image(image, blocking, origin, region, row_pitch, 0,
                               ptr, condition, events);
}

clq_command_queue& clq_command_queue::write_image(const clq_image3d& image,
                                                  bool blocking,
                                                  const void* ptr,
                                                  clq_condition_list condition,
                                                  clq_output_list events) {
    return write_image(image, blocking, 0, 0, 0, 0, 0, image.width(),
                       image.height(), image.depth(), ptr, condition, events);
}

clq_command_queue& clq_command_queue::write_image(
    const clq_image3d& image, bool blocking, size_t row_pitch,
    size_t slice_pitch, size_t origin_x, size_t origin_y, size_t origin_z,
    size_t width, size_t height, size_t depth, const void* ptr,
    clq_condition_list condition, clq_output_list events) {
    auto origin =
        m_scratch.put(clq_scratch::slot_a, origin_x, origin_y, origin_z);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, depth);
    return enqueue_write_image(image, blocking, origin, region, row_pitch,
                               slice_pitch, ptr, condition, events);
}

clq_command_queue& clq_command_queue::read_image(const clq_image2d& image,
                                                 bool blocking, void* ptr,
                                                 clq_condition_list condition,
                                                 clq_output_list events) {
    return read_image(image, blocking, 0, 0, 0, image.width(), image.height(),
                      ptr, condition, events);
}

clq_command_queue& clq_command_queue::read_image(
    const clq_image2d& image, bool blocking, size_t row_pitch,
    size_t origin_x, size_t origin_y, size_t width, size_t height, void* ptr,
    clq_condition_list condition, clq_output_list events) {
    auto origin = m_scratch.put(clq_scratch::slot_a, origin_x, origin_y, 0);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, 1);
    return enqueue_read_image(image, blocking, origin, region, row_pitch, 0,
                              ptr, condition, events);
}

clq_command_queue& clq_command_queue::read_image(const clq_image3d& image,
                                                 bool blocking, void* ptr,
                                                 clq_condition_list condition,
                                                 clq_output_list events) {
    return read_image(image, blocking, 0, 0, 0, 0, 0, image.width(),
                      image.height(), image.depth(), ptr, condition, events);
}

clq_command_queue& clq_command_queue::read_image(
    const clq_image3d& image, bool blocking, size_t row_pitch,
    size_t slice_pitch, size_t origin_x, size_t origin_y, size_t origin_z,
    size_t width, size_t height, size_t depth, void* ptr,
    clq_condition_list condition, clq_output_list events) {
    auto origin =
        m_scratch.put(clq_scratch::slot_a, origin_x, origin_y, origin_z);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, depth);
    return enqueue_read_image(image, blocking, origin, region, row_pitch,
                              slice_pitch, ptr, condition, events);
}

//
// Image copies
//

clq_command_queue& clq_command_queue::enqueue_copy_image(
    const clq_image& src, const clq_image& dst, const size_t* src_origin,
    const size_t* dst_origin, const size_t* region,
    const clq_condition_list& condition, const clq_output_list& events) {
    LOG_QUEUE_CALL("src = %p, dst = %p, src_origin = %s, dst_origin = %s, "
                   "region = %s",
                   src.native(), dst.native(),
                   vector_to_string(src_origin, 3).c_str(),
                   vector_to_string(dst_origin, 3).c_str(),
                   vector_to_string(region, 3).c_str());
    check_live("copy image");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_copy_image(
        m_queue, src.native(), dst.native(), src_origin, dst_origin, region,
        num_conditions(condition), conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "copy image",
                       "from " + src.to_string() + " to " + dst.to_string() +
                           " src_origin: " + vector_to_string(src_origin, 3) +
                           " dst_origin: " + vector_to_string(dst_origin, 3) +
                           " region: " + vector_to_string(region, 3),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::copy_image(const clq_image2d& src,
                                                 const clq_image2d& dst,
                                                 clq_condition_list condition,
                                                 clq_output_list events) {
    return copy_image(src, dst, 0, 0, 0, 0, src.width(), src.height(),
                      condition, events);
}

clq_command_queue& clq_command_queue::copy_image(
    const clq_image2d& src, const clq_image2d& dst, size_t src_x, size_t src_y,
    size_t dst_x, size_t dst_y, size_t width, size_t height,
    clq_condition_list condition, clq_output_list events) {
    auto src_origin = m_scratch.put(clq_scratch::slot_a, src_x, src_y, 0);
    auto dst_origin = m_scratch.put(clq_scratch::slot_b, dst_x, dst_y, 0);
    auto region = m_scratch.put(clq_scratch::slot_c, width, height, 1);
    return enqueue_copy_image(src, dst, src_origin, dst_origin, region,
                              condition, events);
}

clq_command_queue& clq_command_queue::copy_image(const clq_image3d& src,
                                                 const clq_image3d& dst,
                                                 clq_condition_list condition,
                                                 clq_output_list events) {
    return copy_image(src, dst, 0, 0, 0, 0, 0, 0, src.width(), src.height(),
                      src.depth(), condition, events);
}

clq_command_queue& clq_command_queue::copy_image(
    const clq_image3d& src, const clq_image3d& dst, size_t src_x, size_t src_y,
    size_t src_z, size_t dst_x, size_t dst_y, size_t dst_z, size_t width,
    size_t height, size_t depth, clq_condition_list condition,
    clq_output_list events) {
    auto src_origin = m_scratch.put(clq_scratch::slot_a, src_x, src_y, src_z);
    auto dst_origin = m_scratch.put(clq_scratch::slot_b, dst_x, dst_y, dst_z);
    auto region = m_scratch.put(clq_scratch::slot_c, width, height, depth);
    return enqueue_copy_image(src, dst, src_origin, dst_origin, region,
                              condition, events);
}

clq_command_queue& clq_command_queue::enqueue_copy_buffer_to_image(
    const clq_buffer& src, const clq_image& dst, size_t src_offset,
    const size_t* dst_origin, const size_t* region,
    const clq_condition_list& condition, const clq_output_list& events) {
    LOG_QUEUE_CALL("src = %p, dst = %p, src_offset = %zu, dst_origin = %s, "
                   "region = %s",
                   src.native(), dst.native(), src_offset,
                   vector_to_string(dst_origin, 3).c_str(),
                   vector_to_string(region, 3).c_str());
    check_live("copy buffer to image");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_copy_buffer_to_image(
        m_queue, src.native(), dst.native(), src_offset, dst_origin, region,
        num_conditions(condition), conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "copy buffer to image",
                       "from " + src.to_string() + " to " + dst.to_string() +
                           " src_offset: " + std::to_string(src_offset) +
                           " dst_origin: " + vector_to_string(dst_origin, 3) +
                           " region: " + vector_to_string(region, 3),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::copy_buffer_to_image(
    const clq_buffer& src, const clq_image2d& dst,
    clq_condition_list condition, clq_output_list events) {
    return copy_buffer_to_image(src, dst, 0, 0, 0, dst.width(), dst.height(),
                                condition, events);
}

clq_command_queue& clq_command_queue::copy_buffer_to_image(
    const clq_buffer& src, const clq_image2d& dst, size_t src_offset,
    size_t dst_x, size_t dst_y, size_t width, size_t height,
    clq_condition_list condition, clq_output_list events) {
    auto dst_origin = m_scratch.put(clq_scratch::slot_a, dst_x, dst_y, 0);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, 1);
    return enqueue_copy_buffer_to_image(src, dst, src_offset, dst_origin,
                                        region, condition, events);
}

clq_command_queue& clq_command_queue::copy_buffer_to_image(
    const clq_buffer& src, const clq_image3d& dst,
    clq_condition_list condition, clq_output_list events) {
    return copy_buffer_to_image(src, dst, 0, 0, 0, 0, dst.width(),
                                dst.height(), dst.depth(), condition, events);
}

clq_command_queue& clq_command_queue::copy_buffer_to_image(
    const clq_buffer& src, const clq_image3d& dst, size_t src_offset,
    size_t dst_x, size_t dst_y, size_t dst_z, size_t width, size_t height,
    size_t depth, clq_condition_list condition, clq_output_list events) {
    auto dst_origin = m_scratch.put(clq_scratch::slot_a, dst_x, dst_y, dst_z);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, depth);
    return enqueue_copy_buffer_to_image(src, dst, src_offset, dst_origin,
                                        region, condition, events);
}

clq_command_queue& clq_command_queue::enqueue_copy_image_to_buffer(
    const clq_image& src, const clq_buffer& dst, const size_t* src_origin,
    const size_t* region, size_t dst_offset,
    const clq_condition_list& condition, const clq_output_list& events) {
    LOG_QUEUE_CALL("src = %p, dst = %p, src_origin = %s, region = %s, "
                   "dst_offset = %zu",
                   src.native(), dst.native(),
                   vector_to_string(src_origin, 3).c_str(),
                   vector_to_string(region, 3).c_str(), dst_offset);
    check_live("copy image to buffer");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_copy_image_to_buffer(
        m_queue, src.native(), dst.native(), src_origin, region, dst_offset,
        num_conditions(condition), conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "copy image to buffer",
                       "from " + src.to_string() + " to " + dst.to_string() +
                           " src_origin: " + vector_to_string(src_origin, 3) +
                           " region: " + vector_to_string(region, 3) +
                           " dst_offset: " + std::to_string(dst_offset),
                       condition, events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::copy_image_to_buffer(
    const clq_image2d& src, const clq_buffer& dst,
    clq_condition_list condition, clq_output_list events) {
    return copy_image_to_buffer(src, dst, 0, 0, src.width(), src.height(), 0,
                                condition, events);
}

clq_command_queue& clq_command_queue::copy_image_to_buffer(
    const clq_image2d& src, const clq_buffer& dst, size_t src_x, size_t src_y,
    size_t width, size_t height, size_t dst_offset,
    clq_condition_list condition, clq_output_list events) {
    auto src_origin = m_scratch.put(clq_scratch::slot_a, src_x, src_y, 0);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, 1);
    return enqueue_copy_image_to_buffer(src, dst, src_origin, region,
                                        dst_offset, condition, events);
}

clq_command_queue& clq_command_queue::copy_image_to_buffer(
    const clq_image3d& src, const clq_buffer& dst,
    clq_condition_list condition, clq_output_list events) {
    return copy_image_to_buffer(src, dst, 0, 0, 0, src.width(), src.height(),
                                src.depth(), 0, condition, events);
}

clq_command_queue& clq_command_queue::copy_image_to_buffer(
    const clq_image3d& src, const clq_buffer& dst, size_t src_x, size_t src_y,
    size_t src_z, size_t width, size_t height, size_t depth, size_t dst_offset,
    clq_condition_list condition, clq_output_list events) {
    auto src_origin = m_scratch.put(clq_scratch::slot_a, src_x, src_y, src_z);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, depth);
    return enqueue_copy_image_to_buffer(src, dst, src_origin, region,
                                        dst_offset, condition, events);
}

//
// Mapping
//

clq_mapping clq_command_queue::map_buffer(clq_buffer& buffer,
                                          clq_map_flag flag, bool blocking,
                                          clq_condition_list condition,
                                          clq_output_list events) {
    return map_buffer(buffer, flag, blocking, 0, buffer.size(), condition,
                      events);
}

clq_mapping clq_command_queue::map_buffer(clq_buffer& buffer,
                                          clq_map_flag flag, bool blocking,
                                          size_t offset, size_t size,
                                          clq_condition_list condition,
                                          clq_output_list events) {
    LOG_QUEUE_CALL("buffer = %p, flag = %s, blocking = %d, offset = %zu, "
                   "size = %zu",
                   buffer.native(), map_flag_to_string(flag), blocking, offset,
                   size);
    check_live("map buffer");
    if (buffer.is_mapped()) {
        clq_warn_fn("%s is already mapped", buffer.to_string().c_str());
    }

    cl_event* event = reserve_event(events);
    cl_int err;
    void* ptr = m_driver->enqueue_map_buffer(
        m_queue, buffer.native(), to_cl_bool(blocking),
        static_cast<cl_map_flags>(flag), offset, size,
        num_conditions(condition), conditions(condition), event, &err);
    if (err != CL_SUCCESS) {
        command_failed(err, "map buffer",
                       buffer.to_string() + " " +
                           offset_to_string(offset, size) +
                           " flag: " + map_flag_to_string(flag),
                       condition, events);
    }
    commit_event(events);

    clq_mapping mapping = {ptr, size, 0, 0};
    buffer.set_mapping(mapping);
    return mapping;
}

clq_mapping clq_command_queue::enqueue_map_image(
    clq_image& image, clq_map_flag flag, bool blocking, const size_t* origin,
    const size_t* region, const clq_condition_list& condition,
    const clq_output_list& events) {
    LOG_QUEUE_CALL("image = %p, flag = %s, blocking = %d, origin = %s, "
                   "region = %s",
                   image.native(), map_flag_to_string(flag), blocking,
                   vector_to_string(origin, 3).c_str(),
                   vector_to_string(region, 3).c_str());
    check_live("map image");
    if (image.is_mapped()) {
        clq_warn_fn("%s is already mapped", image.to_string().c_str());
    }

    cl_event* event = reserve_event(events);
    cl_int err;
    size_t row_pitch = 0;
    size_t slice_pitch = 0;
    void* ptr = m_driver->enqueue_map_image(
        m_queue, image.native(), to_cl_bool(blocking),
        static_cast<cl_map_flags>(flag), origin, region, &row_pitch,
        &slice_pitch, num_conditions(condition), conditions(condition), event,
        &err);
    if (err != CL_SUCCESS) {
        command_failed(err, "map image",
                       image.to_string() +
                           " origin: " + vector_to_string(origin, 3) +
                           " region: " + vector_to_string(region, 3) +
                           " flag: " + map_flag_to_string(flag),
                       condition, events);
    }
    commit_event(events);

    // Bytes from the start of the window to the end of its last pixel
    size_t size = (region[2] - 1) * slice_pitch +
                  (region[1] - 1) * row_pitch +
                  region[0] * image.element_size();
    clq_mapping mapping = {ptr, size, row_pitch, slice_pitch};
    image.set_mapping(mapping);
    return mapping;
}

clq_mapping clq_command_queue::map_image(clq_image2d& image,
                                         clq_map_flag flag, bool blocking,
                                         clq_condition_list condition,
                                         clq_output_list events) {
    return map_image(image, flag, blocking, 0, 0, image.width(),
                     image.height(), condition, events);
}

clq_mapping clq_command_queue::map_image(clq_image2d& image,
                                         clq_map_flag flag, bool blocking,
                                         size_t origin_x, size_t origin_y,
                                         size_t width, size_t height,
                                         clq_condition_list condition,
                                         clq_output_list events) {
    auto origin = m_scratch.put(clq_scratch::slot_a, origin_x, origin_y, 0);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, 1);
    return enqueue_map_image(image, flag, blocking, origin, region, condition,
                             events);
}

clq_mapping clq_command_queue::map_image(clq_image3d& image,
                                         clq_map_flag flag, bool blocking,
                                         clq_condition_list condition,
                                         clq_output_list events) {
    return map_image(image, flag, blocking, 0, 0, 0, image.width(),
                     image.height(), image.depth(), condition, events);
}

clq_mapping clq_command_queue::map_image(
    clq_image3d& image, clq_map_flag flag, bool blocking, size_t origin_x,
    size_t origin_y, size_t origin_z, size_t width, size_t height,
    size_t depth, clq_condition_list condition, clq_output_list events) {
    auto origin =
        m_scratch.put(clq_scratch::slot_a, origin_x, origin_y, origin_z);
    auto region = m_scratch.put(clq_scratch::slot_b, width, height, depth);
    return enqueue_map_image(image, flag, blocking, origin, region, condition,
                             events);
}

clq_command_queue& clq_command_queue::unmap_memory(clq_mem& mem,
                                                   clq_condition_list condition,
                                                   clq_output_list events) {
    LOG_QUEUE_CALL("mem = %p", mem.native());
    check_live("unmap memory");
    if (!mem.is_mapped()) {
        std::string msg = "can not unmap memory: " + mem.to_string() +
                          " is not mapped";
        clq_error("%s", msg.c_str());
        throw clq_resource_state_error(msg);
    }

    void* ptr = mem.mapping().ptr;
    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_unmap_mem_object(
        m_queue, mem.native(), ptr, num_conditions(condition),
        conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(err, "unmap memory",
                       mem.to_string() + " ptr: " + pointer_to_string(ptr),
                       condition, events);
    }
    commit_event(events);
    mem.clear_mapping();
    return *this;
}

//
// Synchronisation
//

clq_command_queue& clq_command_queue::marker(clq_event_list& events) {
    LOG_QUEUE_CALL("events = %s", events.to_string().c_str());
    check_live("enqueue marker");

    cl_event* event = events.reserve_slot(m_driver);
    cl_int err = m_driver->enqueue_marker(m_queue, event);
    if (err != CL_SUCCESS) {
        command_failed(err, "enqueue marker", to_string(), std::nullopt,
                       events);
    }
    events.commit_slot();
    return *this;
}

clq_command_queue& clq_command_queue::wait_for_event(const clq_event_list& list,
                                                     size_t index,
                                                     bool blocking) {
    LOG_QUEUE_CALL("list = %s, index = %zu, blocking = %d",
                   list.to_string().c_str(), index, blocking);
    check_live("wait for event");
    if (index >= list.size()) {
        clq_error_fn("index %zu out of range in %s", index,
                     list.to_string().c_str());
        throw std::out_of_range("event index " + std::to_string(index) +
                                " out of range in " + list.to_string());
    }

    const cl_event* event = list.ids() + index;
    cl_int err;
    if (blocking) {
        err = m_driver->wait_for_events(1, event);
    } else {
        err = m_driver->enqueue_wait_for_events(m_queue, 1, event);
    }
    if (err != CL_SUCCESS) {
        command_failed(err, "wait for event",
                       "index: " + std::to_string(index) +
                           " blocking: " + std::to_string(blocking),
                       list, std::nullopt);
    }
    return *this;
}

clq_command_queue&
clq_command_queue::wait_for_events(const clq_event_list& list, bool blocking) {
    LOG_QUEUE_CALL("list = %s, blocking = %d", list.to_string().c_str(),
                   blocking);
    check_live("wait for events");

    auto num_events = static_cast<cl_uint>(list.size());
    cl_int err;
    if (blocking) {
        err = m_driver->wait_for_events(num_events, list.ids());
    } else {
        err = m_driver->enqueue_wait_for_events(m_queue, num_events,
                                                list.ids());
    }
    if (err != CL_SUCCESS) {
        command_failed(err, "wait for events",
                       "blocking: " + std::to_string(blocking), list,
                       std::nullopt);
    }
    return *this;
}

clq_command_queue& clq_command_queue::barrier() {
    clq_debug_group_fn(loggroup::api, "queue = %p", m_queue);
    check_live("enqueue barrier");

    cl_int err = m_driver->enqueue_barrier(m_queue);
    if (err != CL_SUCCESS) {
        command_failed(err, "enqueue barrier", to_string(), std::nullopt,
                       std::nullopt);
    }
    return *this;
}

//
// Kernels
//

clq_command_queue& clq_command_queue::task(const clq_kernel& kernel,
                                           clq_condition_list condition,
                                           clq_output_list events) {
    return range_kernel_1d(kernel, 0, 1, 1, condition, events);
}

clq_command_queue& clq_command_queue::range_kernel_1d(
    const clq_kernel& kernel, size_t global_offset, size_t global_size,
    size_t local_size, clq_condition_list condition, clq_output_list events) {
    const size_t* offset = nullptr;
    const size_t* global = nullptr;
    const size_t* local = nullptr;
    if (global_offset != 0) {
        offset = m_scratch.put(clq_scratch::slot_a, global_offset);
    }
    if (global_size != 0) {
        global = m_scratch.put(clq_scratch::slot_b, global_size);
    }
    if (local_size != 0) {
        local = m_scratch.put(clq_scratch::slot_c, local_size);
    }
    return nd_range_kernel(kernel, 1, offset, global, local, condition,
                           events);
}

clq_command_queue& clq_command_queue::range_kernel_2d(
    const clq_kernel& kernel, size_t global_offset_x, size_t global_offset_y,
    size_t global_size_x, size_t global_size_y, size_t local_size_x,
    size_t local_size_y, clq_condition_list condition,
    clq_output_list events) {
    const size_t* offset = nullptr;
    const size_t* global = nullptr;
    const size_t* local = nullptr;
    if (global_offset_x != 0 && global_offset_y != 0) {
        offset = m_scratch.put(clq_scratch::slot_a, global_offset_x,
                               global_offset_y);
    }
    if (global_size_x != 0 && global_size_y != 0) {
        global =
            m_scratch.put(clq_scratch::slot_b, global_size_x, global_size_y);
    }
    if (local_size_x != 0 && local_size_y != 0) {
        local = m_scratch.put(clq_scratch::slot_c, local_size_x, local_size_y);
    }
    return nd_range_kernel(kernel, 2, offset, global, local, condition,
                           events);
}

clq_command_queue& clq_command_queue::nd_range_kernel(
    const clq_kernel& kernel, cl_uint work_dim, const size_t* global_offset,
    const size_t* global_size, const size_t* local_size,
    clq_condition_list condition, clq_output_list events) {
    // Vectors hold at most 3 values whatever work_dim says
    cl_uint num_shown = std::min<cl_uint>(work_dim, 3);
    LOG_QUEUE_CALL("kernel = %s, work_dim = %u, offset = %s, global = %s, "
                   "local = %s",
                   kernel.name().c_str(), work_dim,
                   vector_to_string(global_offset, num_shown).c_str(),
                   vector_to_string(global_size, num_shown).c_str(),
                   vector_to_string(local_size, num_shown).c_str());
    check_live("enqueue kernel");

    cl_event* event = reserve_event(events);
    cl_int err = m_driver->enqueue_nd_range_kernel(
        m_queue, kernel.native(), work_dim, global_offset, global_size,
        local_size, num_conditions(condition), conditions(condition), event);
    if (err != CL_SUCCESS) {
        command_failed(
            err, "enqueue kernel",
            kernel.to_string() + " work_dim: " + std::to_string(work_dim) +
                " offset: " + vector_to_string(global_offset, num_shown) +
                " global: " + vector_to_string(global_size, num_shown) +
                " local: " + vector_to_string(local_size, num_shown),
            condition, events);
    }
    commit_event(events);
    return *this;
}

//
// GL interop
//

clq_command_queue& clq_command_queue::enqueue_gl_objects(
    bool acquire, cl_mem gl_object, const clq_condition_list& condition,
    const clq_output_list& events) {
    const char* operation = acquire ? "acquire GL object" : "release GL object";
    LOG_QUEUE_CALL("%s, object = %p", operation, gl_object);
    check_live(operation);

    auto gl = m_driver->gl_sharing();
    if (gl == nullptr) {
        std::string msg = std::string("can not ") + operation + ": driver " +
                          m_driver->name() + " does not support GL sharing";
        clq_error("%s", msg.c_str());
        throw clq_resource_state_error(msg);
    }

    cl_event* event = reserve_event(events);
    auto objects = m_scratch.put_handle(gl_object);
    cl_int err;
    if (acquire) {
        err = gl->enqueue_acquire_gl_objects(m_queue, 1, objects,
                                             num_conditions(condition),
                                             conditions(condition), event);
    } else {
        err = gl->enqueue_release_gl_objects(m_queue, 1, objects,
                                             num_conditions(condition),
                                             conditions(condition), event);
    }
    if (err != CL_SUCCESS) {
        command_failed(err, operation,
                       "object: " + pointer_to_string(gl_object), condition,
                       events);
    }
    commit_event(events);
    return *this;
}

clq_command_queue& clq_command_queue::acquire_gl_object(
    cl_mem gl_object, clq_condition_list condition, clq_output_list events) {
    return enqueue_gl_objects(true, gl_object, condition, events);
}

clq_command_queue& clq_command_queue::release_gl_object(
    cl_mem gl_object, clq_condition_list condition, clq_output_list events) {
    return enqueue_gl_objects(false, gl_object, condition, events);
}

//
// Queue state
//

clq_command_queue& clq_command_queue::finish() {
    clq_debug_group_fn(loggroup::api, "queue = %p", m_queue);
    check_live("finish");
    cl_int err = m_driver->finish(m_queue);
    clq_check_status(err, "finish", to_string());
    return *this;
}

clq_command_queue& clq_command_queue::flush() {
    clq_debug_group_fn(loggroup::api, "queue = %p", m_queue);
    check_live("flush");
    cl_int err = m_driver->flush(m_queue);
    clq_check_status(err, "flush", to_string());
    return *this;
}

void clq_command_queue::set_property(clq_queue_mode mode, bool enabled) {
    LOG_QUEUE_CALL("mode = %s, enabled = %d", queue_mode_to_string(mode),
                   enabled);
    check_live("set property");

    cl_command_queue_properties old_properties;
    cl_int err = m_driver->set_command_queue_property(
        m_queue, static_cast<cl_command_queue_properties>(mode),
        to_cl_bool(enabled), &old_properties);
    clq_check_status(err, "set property",
                     to_string() + " mode: " + queue_mode_to_string(mode) +
                         " enabled: " + std::to_string(enabled));
    m_properties.set(mode, enabled);
}

void clq_command_queue::release() {
    clq_debug_group(loggroup::refcounting, "releasing %s",
                    to_string().c_str());
    check_live("release command queue");

    if (config.queue_finish_on_release) {
        try {
            finish();
        } catch (const clq_command_error& e) {
            clq_warn("could not finish before release: %s", e.what());
        }
    }

    m_released = true;
    cl_int err = m_driver->release_command_queue(m_queue);
    m_context->on_command_queue_released(this);
    clq_check_status(err, "release command queue", to_string());
}

bool clq_command_queue::operator==(const clq_command_queue& other) const {
    return m_queue == other.m_queue && m_context == other.m_context &&
           m_device == other.m_device;
}

std::string clq_command_queue::to_string() const {
    return "command_queue{" + pointer_to_string(m_queue) +
           ", device: " + pointer_to_string(m_device.native()) +
           ", modes: " + m_properties.to_string() + "}";
}
