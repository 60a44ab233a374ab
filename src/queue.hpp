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
#include "event.hpp"
#include "kernel.hpp"
#include "memory.hpp"
#include "scratch.hpp"

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>

struct clq_context;

enum class clq_queue_mode : cl_command_queue_properties
{
    out_of_order = CL_QUEUE_OUT_OF_ORDER_EXEC_MODE_ENABLE,
    profiling = CL_QUEUE_PROFILING_ENABLE,
};

const char* queue_mode_to_string(clq_queue_mode mode);

// Set of queue modes, convertible to and from the native bitfield.
struct clq_queue_mode_set {

    clq_queue_mode_set() : m_bits(0) {}
    clq_queue_mode_set(std::initializer_list<clq_queue_mode> modes);

    // Keep the bits of `bits` that name a known mode, ignore the others.
    static clq_queue_mode_set from_bitfield(cl_command_queue_properties bits);

    // The mode whose native value is exactly `value`, if any.
    static std::optional<clq_queue_mode>
    mode_from_value(cl_command_queue_properties value);

    bool contains(clq_queue_mode mode) const {
        return (m_bits & static_cast<cl_command_queue_properties>(mode)) != 0;
    }

    void set(clq_queue_mode mode, bool enabled);

    cl_command_queue_properties bits() const { return m_bits; }
    bool empty() const { return m_bits == 0; }

    std::string to_string() const;

    bool operator==(const clq_queue_mode_set& other) const {
        return m_bits == other.m_bits;
    }
    bool operator!=(const clq_queue_mode_set& other) const {
        return m_bits != other.m_bits;
    }

private:
    cl_command_queue_properties m_bits;
};

// Events the new command waits for. Absent and empty are different: an
// absent list passes no wait list to the driver at all.
using clq_condition_list =
    std::optional<std::reference_wrapper<const clq_event_list>>;

// List receiving the event of the new command.
using clq_output_list = std::optional<std::reference_wrapper<clq_event_list>>;

// Command queue bound to one device of a context.
//
// Every enqueue method takes an optional condition list and an optional
// output list and returns the queue. On success exactly one event is added
// to the output list. A full output list is rejected with
// clq_capacity_error before anything is submitted. A driver failure is
// reported as a clq_command_error and leaves the queue usable.
//
// Argument arrays passed to the driver are marshaled through storage owned
// by the queue: a queue must not be used from several threads at once
// without external locking.
struct clq_command_queue {

    ~clq_command_queue();

    clq_command_queue(const clq_command_queue&) = delete;
    clq_command_queue& operator=(const clq_command_queue&) = delete;

    // Buffer transfers. Without an offset and size the whole buffer is
    // transferred.
    clq_command_queue& write_buffer(const clq_buffer& buffer, bool blocking,
                                    const void* ptr,
                                    clq_condition_list condition = std::nullopt,
                                    clq_output_list events = std::nullopt);
    clq_command_queue& write_buffer(const clq_buffer& buffer, bool blocking,
                                    size_t offset, size_t size,
                                    const void* ptr,
                                    clq_condition_list condition = std::nullopt,
                                    clq_output_list events = std::nullopt);
    clq_command_queue& read_buffer(const clq_buffer& buffer, bool blocking,
                                   void* ptr,
                                   clq_condition_list condition = std::nullopt,
                                   clq_output_list events = std::nullopt);
    clq_command_queue& read_buffer(const clq_buffer& buffer, bool blocking,
                                   size_t offset, size_t size, void* ptr,
                                   clq_condition_list condition = std::nullopt,
                                   clq_output_list events = std::nullopt);

    // Image transfers. 2D forms are issued with a z origin of 0 and a depth
    // of 1. A pitch of 0 lets the driver compute it from the region.
    clq_command_queue& write_image(const clq_image2d& image, bool blocking,
                                   const void* ptr,
                                   clq_condition_list condition = std::nullopt,
                                   clq_output_list events = std::nullopt);
    clq_command_queue& write_image(const clq_image2d& image, bool blocking,
                                   size_t row_pitch, size_t origin_x,
                                   size_t origin_y, size_t width,
                                   size_t height, const void* ptr,
                                   clq_condition_list condition = std::nullopt,
                                   clq_output_list events = std::nullopt);
    clq_command_queue& write_image(const clq_image3d& image, bool blocking,
                                   const void* ptr,
                                   clq_condition_list condition = std::nullopt,
                                   clq_output_list events = std::nullopt);
    clq_command_queue&
    write_image(const clq_image3d& image, bool blocking, size_t row_pitch,
                size_t slice_pitch, size_t origin_x, size_t origin_y,
                size_t origin_z, size_t width, size_t height, size_t depth,
                const void* ptr, clq_condition_list condition = std::nullopt,
                clq_output_list events = std::nullopt);
    clq_command_queue& read_image(const clq_image2d& image, bool blocking,
                                  void* ptr,
                                  clq_condition_list condition = std::nullopt,
                                  clq_output_list events = std::nullopt);
    clq_command_queue& read_image(const clq_image2d& image, bool blocking,
                                  size_t row_pitch, size_t origin_x,
                                  size_t origin_y, size_t width, size_t height,
                                  void* ptr,
                                  clq_condition_list condition = std::nullopt,
                                  clq_output_list events = std::nullopt);
    clq_command_queue& read_image(const clq_image3d& image, bool blocking,
                                  void* ptr,
                                  clq_condition_list condition = std::nullopt,
                                  clq_output_list events = std::nullopt);
    clq_command_queue&
    read_image(const clq_image3d& image, bool blocking, size_t row_pitch,
               size_t slice_pitch, size_t origin_x, size_t origin_y,
               size_t origin_z, size_t width, size_t height, size_t depth,
               void* ptr, clq_condition_list condition = std::nullopt,
               clq_output_list events = std::nullopt);

    // Copies are never blocking.
    clq_command_queue& copy_buffer(const clq_buffer& src, const clq_buffer& dst,
                                   clq_condition_list condition = std::nullopt,
                                   clq_output_list events = std::nullopt);
    clq_command_queue& copy_buffer(const clq_buffer& src, const clq_buffer& dst,
                                   size_t src_offset, size_t dst_offset,
                                   size_t size,
                                   clq_condition_list condition = std::nullopt,
                                   clq_output_list events = std::nullopt);
    clq_command_queue& copy_image(const clq_image2d& src,
                                  const clq_image2d& dst,
                                  clq_condition_list condition = std::nullopt,
                                  clq_output_list events = std::nullopt);
    clq_command_queue& copy_image(const clq_image2d& src,
                                  const clq_image2d& dst, size_t src_x,
                                  size_t src_y, size_t dst_x, size_t dst_y,
                                  size_t width, size_t height,
                                  clq_condition_list condition = std::nullopt,
                                  clq_output_list events = std::nullopt);
    clq_command_queue& copy_image(const clq_image3d& src,
                                  const clq_image3d& dst,
                                  clq_condition_list condition = std::nullopt,
                                  clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_image(const clq_image3d& src, const clq_image3d& dst, size_t src_x,
               size_t src_y, size_t src_z, size_t dst_x, size_t dst_y,
               size_t dst_z, size_t width, size_t height, size_t depth,
               clq_condition_list condition = std::nullopt,
               clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_buffer_to_image(const clq_buffer& src, const clq_image2d& dst,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_buffer_to_image(const clq_buffer& src, const clq_image2d& dst,
                         size_t src_offset, size_t dst_x, size_t dst_y,
                         size_t width, size_t height,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_buffer_to_image(const clq_buffer& src, const clq_image3d& dst,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_buffer_to_image(const clq_buffer& src, const clq_image3d& dst,
                         size_t src_offset, size_t dst_x, size_t dst_y,
                         size_t dst_z, size_t width, size_t height,
                         size_t depth,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_image_to_buffer(const clq_image2d& src, const clq_buffer& dst,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_image_to_buffer(const clq_image2d& src, const clq_buffer& dst,
                         size_t src_x, size_t src_y, size_t width,
                         size_t height, size_t dst_offset,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_image_to_buffer(const clq_image3d& src, const clq_buffer& dst,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);
    clq_command_queue&
    copy_image_to_buffer(const clq_image3d& src, const clq_buffer& dst,
                         size_t src_x, size_t src_y, size_t src_z,
                         size_t width, size_t height, size_t depth,
                         size_t dst_offset,
                         clq_condition_list condition = std::nullopt,
                         clq_output_list events = std::nullopt);

    // Map a region of a memory object into host memory. The window is
    // recorded in the memory object until unmap_memory() is called. With a
    // non-blocking map the window may only be accessed once the map command
    // has completed. Mapping an object that is already mapped records the new
    // window only: the earlier window stays mapped in the driver and can no
    // longer be unmapped through this queue.
    clq_mapping map_buffer(clq_buffer& buffer, clq_map_flag flag,
                           bool blocking,
                           clq_condition_list condition = std::nullopt,
                           clq_output_list events = std::nullopt);
    clq_mapping map_buffer(clq_buffer& buffer, clq_map_flag flag,
                           bool blocking, size_t offset, size_t size,
                           clq_condition_list condition = std::nullopt,
                           clq_output_list events = std::nullopt);
    clq_mapping map_image(clq_image2d& image, clq_map_flag flag, bool blocking,
                          clq_condition_list condition = std::nullopt,
                          clq_output_list events = std::nullopt);
    clq_mapping map_image(clq_image2d& image, clq_map_flag flag, bool blocking,
                          size_t origin_x, size_t origin_y, size_t width,
                          size_t height,
                          clq_condition_list condition = std::nullopt,
                          clq_output_list events = std::nullopt);
    clq_mapping map_image(clq_image3d& image, clq_map_flag flag, bool blocking,
                          clq_condition_list condition = std::nullopt,
                          clq_output_list events = std::nullopt);
    clq_mapping map_image(clq_image3d& image, clq_map_flag flag, bool blocking,
                          size_t origin_x, size_t origin_y, size_t origin_z,
                          size_t width, size_t height, size_t depth,
                          clq_condition_list condition = std::nullopt,
                          clq_output_list events = std::nullopt);

    // Unmap the window recorded by the last map of `mem`.
    clq_command_queue& unmap_memory(clq_mem& mem,
                                    clq_condition_list condition = std::nullopt,
                                    clq_output_list events = std::nullopt);

    // Add an event that completes once every command previously enqueued
    // has completed.
    clq_command_queue& marker(clq_event_list& events);

    // Wait for one event of a list, or for all of them. A blocking wait
    // suspends the caller, otherwise the wait is enqueued.
    clq_command_queue& wait_for_event(const clq_event_list& list, size_t index,
                                      bool blocking);
    clq_command_queue& wait_for_events(const clq_event_list& list,
                                       bool blocking);

    // Commands enqueued after the barrier only start once every command
    // enqueued before it has completed.
    clq_command_queue& barrier();

    // Launch a single work-item.
    clq_command_queue& task(const clq_kernel& kernel,
                            clq_condition_list condition = std::nullopt,
                            clq_output_list events = std::nullopt);

    // Convenience launches. A value of 0 passes no vector for that
    // argument to the driver: an offset of 0 means no offset, a local size
    // of 0 lets the driver pick one. In 2D the whole vector is omitted when
    // either component is 0. Use nd_range_kernel() to pass vectors that
    // contain zeros.
    clq_command_queue&
    range_kernel_1d(const clq_kernel& kernel, size_t global_offset,
                    size_t global_size, size_t local_size,
                    clq_condition_list condition = std::nullopt,
                    clq_output_list events = std::nullopt);
    clq_command_queue&
    range_kernel_2d(const clq_kernel& kernel, size_t global_offset_x,
                    size_t global_offset_y, size_t global_size_x,
                    size_t global_size_y, size_t local_size_x,
                    size_t local_size_y,
                    clq_condition_list condition = std::nullopt,
                    clq_output_list events = std::nullopt);

    // Each vector holds `work_dim` values or is null.
    clq_command_queue&
    nd_range_kernel(const clq_kernel& kernel, cl_uint work_dim,
                    const size_t* global_offset, const size_t* global_size,
                    const size_t* local_size,
                    clq_condition_list condition = std::nullopt,
                    clq_output_list events = std::nullopt);

    // Hand a GL object over to the compute device and back. Requires a
    // driver with GL sharing support.
    clq_command_queue&
    acquire_gl_object(cl_mem gl_object,
                      clq_condition_list condition = std::nullopt,
                      clq_output_list events = std::nullopt);
    clq_command_queue&
    release_gl_object(cl_mem gl_object,
                      clq_condition_list condition = std::nullopt,
                      clq_output_list events = std::nullopt);

    clq_command_queue& finish();
    clq_command_queue& flush();

    bool is_profiling_enabled() const {
        return m_properties.contains(clq_queue_mode::profiling);
    }
    bool is_out_of_order_enabled() const {
        return m_properties.contains(clq_queue_mode::out_of_order);
    }
    const clq_queue_mode_set& properties() const { return m_properties; }

    // Enable or disable a mode after creation. The tracked modes only
    // change when the driver accepts the change. Whether a driver supports
    // this at all is implementation dependent.
    void set_property(clq_queue_mode mode, bool enabled);

    // Release the native queue and detach from the context. Releasing twice,
    // or enqueueing on a released queue, throws clq_resource_state_error.
    void release();
    bool is_released() const { return m_released; }

    const clq_device& device() const { return m_device; }
    clq_context* context() const { return m_context; }
    cl_command_queue native() const { return m_queue; }

    bool operator==(const clq_command_queue& other) const;
    bool operator!=(const clq_command_queue& other) const {
        return !(*this == other);
    }

    std::string to_string() const;

private:
    friend struct clq_context;

    clq_command_queue(clq_context* ctx, const clq_device& device,
                      cl_command_queue queue, clq_queue_mode_set properties);

    void check_live(const char* operation) const;

    // Slot for the new event, or nullptr when there is no output list.
    CHECK_RETURN cl_event* reserve_event(const clq_output_list& events);
    void commit_event(const clq_output_list& events);

    // Throw a clq_command_error describing the failed command.
    void command_failed(cl_int err, const char* operation,
                        const std::string& operands,
                        const clq_condition_list& condition,
                        const clq_output_list& events) const;

    clq_command_queue&
    enqueue_read_image(const clq_image& image, bool blocking,
                       const size_t* origin, const size_t* region,
                       size_t row_pitch, size_t slice_pitch, void* ptr,
                       const clq_condition_list& condition,
                       const clq_output_list& events);
    clq_command_queue&
    enqueue_write_image(const clq_image& image, bool blocking,
                        const size_t* origin, const size_t* region,
                        size_t row_pitch, size_t slice_pitch, const void* ptr,
                        const clq_condition_list& condition,
                        const clq_output_list& events);
    clq_command_queue& enqueue_copy_image(const clq_image& src,
                                          const clq_image& dst,
                                          const size_t* src_origin,
                                          const size_t* dst_origin,
                                          const size_t* region,
                                          const clq_condition_list& condition,
                                          const clq_output_list& events);
    clq_command_queue& enqueue_copy_buffer_to_image(
        const clq_buffer& src, const clq_image& dst, size_t src_offset,
        const size_t* dst_origin, const size_t* region,
        const clq_condition_list& condition, const clq_output_list& events);
    clq_command_queue& enqueue_copy_image_to_buffer(
        const clq_image& src, const clq_buffer& dst, const size_t* src_origin,
        const size_t* region, size_t dst_offset,
        const clq_condition_list& condition, const clq_output_list& events);
    clq_mapping enqueue_map_image(clq_image& image, clq_map_flag flag,
                                  bool blocking, const size_t* origin,
                                  const size_t* region,
                                  const clq_condition_list& condition,
                                  const clq_output_list& events);
    clq_command_queue& enqueue_gl_objects(bool acquire, cl_mem gl_object,
                                          const clq_condition_list& condition,
                                          const clq_output_list& events);

    clq_context* m_context;
    clq_driver* m_driver;
    clq_device m_device;
    cl_command_queue m_queue;
    clq_queue_mode_set m_properties;
    clq_scratch m_scratch;
    bool m_released;
};
