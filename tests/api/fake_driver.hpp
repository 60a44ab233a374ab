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

#include "driver.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Native objects of the in-process driver used by the tests. The driver
// owns every object it creates until it is destroyed; releasing an object
// only marks it as released.

struct _cl_device_id {
    std::string name;
    cl_command_queue_properties queue_properties;
};

struct _cl_context {
    std::vector<cl_device_id> devices;
    bool released;
};

struct _cl_program {};

struct _cl_kernel {
    std::string name;
    std::map<cl_uint, std::vector<unsigned char>> args;
    bool released;
};

struct _cl_mem {
    cl_mem_object_type type;
    cl_mem_flags flags;
    std::vector<unsigned char> data;
    size_t width;
    size_t height;
    size_t depth;
    size_t element_size;
    size_t row_pitch;
    size_t slice_pitch;
    unsigned map_count;
    bool released;
};

struct _cl_command_queue {
    cl_context context;
    cl_device_id device;
    cl_command_queue_properties properties;
    // Commands submitted before this sequence number must complete before
    // any later command starts.
    uint64_t barrier_seq;
    bool released;
};

struct _cl_event {
    cl_command_queue queue;
    cl_command_type type;
    cl_int status;
    bool profiling;
    cl_ulong queued;
    cl_ulong submit;
    cl_ulong start;
    cl_ulong end;
    // References held by the caller
    cl_uint refcount;
};

// What the driver saw for one entry point invocation.
struct fake_call {
    std::string entry;
    cl_command_queue queue;
    std::vector<cl_mem> mem_objects;
    cl_bool blocking;
    cl_map_flags map_flags;
    size_t offset;
    size_t size;
    std::vector<size_t> origin;
    std::vector<size_t> dst_origin;
    std::vector<size_t> region;
    size_t row_pitch;
    size_t slice_pitch;
    cl_kernel kernel;
    cl_uint work_dim;
    std::optional<std::vector<size_t>> global_offset;
    std::optional<std::vector<size_t>> global_size;
    std::optional<std::vector<size_t>> local_size;
    cl_uint num_events_in_wait_list;
    bool has_wait_list;
    std::vector<cl_event> wait_list;
    bool wants_event;
    cl_event event;
};

// Work-item range of an executed kernel. Vectors are empty when the
// launch did not specify them.
struct fake_launch {
    cl_kernel kernel;
    cl_uint work_dim;
    std::vector<size_t> global_offset;
    std::vector<size_t> global_size;
    std::vector<size_t> local_size;
};

// Single-device driver executing commands on the host.
//
// Commands are queued until the host waits for them (finish, a blocking
// command or a host-side event wait). In-order queues then run them in
// submission order. Out-of-order queues run the most recently submitted
// command whose dependencies are satisfied first, so that only events,
// markers and barriers order commands. Every command gets a timestamp from
// a logical clock when it is queued, starts and ends.
class fake_driver final : public clq_driver, public clq_gl_sharing {
public:
    using kernel_function = std::function<void(const fake_launch&)>;

    fake_driver();
    ~fake_driver() override;

    cl_device_id device() const { return m_device.get(); }
    cl_program create_program();

    // Make the next call to `entry` return `status`.
    void fail_next(const std::string& entry, cl_int status);

    void set_gl_sharing(bool enabled) { m_gl_sharing = enabled; }
    void set_queue_property_supported(bool supported) {
        m_queue_property_supported = supported;
    }

    void register_kernel(const std::string& name, kernel_function fn);

    const std::vector<fake_call>& calls() const { return m_calls; }
    const fake_call& last_call() const { return m_calls.back(); }
    size_t num_calls(const std::string& entry) const;

    // Events in the order their commands were executed.
    const std::vector<cl_event>& executed() const { return m_executed; }
    size_t pending_commands() const { return m_pending.size(); }

    const std::vector<unsigned char>& contents(cl_mem mem) const {
        return mem->data;
    }

    size_t live_contexts() const;
    size_t live_queues() const;
    size_t live_mem_objects() const;
    size_t live_kernels() const;
    size_t live_events() const;

    const char* name() const override { return "fake"; }

    cl_context create_context(cl_uint num_devices, const cl_device_id* devices,
                              cl_int* errcode_ret) override;
    cl_int release_context(cl_context context) override;
    cl_int get_device_info(cl_device_id device, cl_device_info param_name,
                           size_t param_value_size, void* param_value,
                           size_t* param_value_size_ret) override;

    cl_command_queue
    create_command_queue(cl_context context, cl_device_id device,
                         cl_command_queue_properties properties,
                         cl_int* errcode_ret) override;
    cl_int set_command_queue_property(
        cl_command_queue queue, cl_command_queue_properties properties,
        cl_bool enable, cl_command_queue_properties* old_properties) override;
    cl_int release_command_queue(cl_command_queue queue) override;
    cl_int flush(cl_command_queue queue) override;
    cl_int finish(cl_command_queue queue) override;

    cl_mem create_buffer(cl_context context, cl_mem_flags flags, size_t size,
                         void* host_ptr, cl_int* errcode_ret) override;
    cl_mem create_image(cl_context context, cl_mem_flags flags,
                        const cl_image_format* image_format,
                        const cl_image_desc* image_desc, void* host_ptr,
                        cl_int* errcode_ret) override;
    cl_int release_mem_object(cl_mem memobj) override;

    cl_kernel create_kernel(cl_program program, const char* kernel_name,
                            cl_int* errcode_ret) override;
    cl_int set_kernel_arg(cl_kernel kernel, cl_uint arg_index, size_t arg_size,
                          const void* arg_value) override;
    cl_int release_kernel(cl_kernel kernel) override;

    cl_int wait_for_events(cl_uint num_events,
                           const cl_event* event_list) override;
    cl_int get_event_info(cl_event event, cl_event_info param_name,
                          size_t param_value_size, void* param_value,
                          size_t* param_value_size_ret) override;
    cl_int get_event_profiling_info(cl_event event,
                                    cl_profiling_info param_name,
                                    size_t param_value_size, void* param_value,
                                    size_t* param_value_size_ret) override;
    cl_int release_event(cl_event event) override;

    cl_int enqueue_read_buffer(cl_command_queue queue, cl_mem buffer,
                               cl_bool blocking_read, size_t offset,
                               size_t size, void* ptr,
                               cl_uint num_events_in_wait_list,
                               const cl_event* event_wait_list,
                               cl_event* event) override;
    cl_int enqueue_write_buffer(cl_command_queue queue, cl_mem buffer,
                                cl_bool blocking_write, size_t offset,
                                size_t size, const void* ptr,
                                cl_uint num_events_in_wait_list,
                                const cl_event* event_wait_list,
                                cl_event* event) override;
    cl_int enqueue_copy_buffer(cl_command_queue queue, cl_mem src_buffer,
                               cl_mem dst_buffer, size_t src_offset,
                               size_t dst_offset, size_t size,
                               cl_uint num_events_in_wait_list,
                               const cl_event* event_wait_list,
                               cl_event* event) override;
    cl_int enqueue_read_image(cl_command_queue queue, cl_mem image,
                              cl_bool blocking_read, const size_t* origin,
                              const size_t* region, size_t row_pitch,
                              size_t slice_pitch, void* ptr,
                              cl_uint num_events_in_wait_list,
                              const cl_event* event_wait_list,
                              cl_event* event) override;
    cl_int enqueue_write_image(cl_command_queue queue, cl_mem image,
                               cl_bool blocking_write, const size_t* origin,
                               const size_t* region, size_t input_row_pitch,
                               size_t input_slice_pitch, const void* ptr,
                               cl_uint num_events_in_wait_list,
                               const cl_event* event_wait_list,
                               cl_event* event) override;
    cl_int enqueue_copy_image(cl_command_queue queue, cl_mem src_image,
                              cl_mem dst_image, const size_t* src_origin,
                              const size_t* dst_origin, const size_t* region,
                              cl_uint num_events_in_wait_list,
                              const cl_event* event_wait_list,
                              cl_event* event) override;
    cl_int enqueue_copy_image_to_buffer(cl_command_queue queue,
                                        cl_mem src_image, cl_mem dst_buffer,
                                        const size_t* src_origin,
                                        const size_t* region,
                                        size_t dst_offset,
                                        cl_uint num_events_in_wait_list,
                                        const cl_event* event_wait_list,
                                        cl_event* event) override;
    cl_int enqueue_copy_buffer_to_image(cl_command_queue queue,
                                        cl_mem src_buffer, cl_mem dst_image,
                                        size_t src_offset,
                                        const size_t* dst_origin,
                                        const size_t* region,
                                        cl_uint num_events_in_wait_list,
                                        const cl_event* event_wait_list,
                                        cl_event* event) override;
    void* enqueue_map_buffer(cl_command_queue queue, cl_mem buffer,
                             cl_bool blocking_map, cl_map_flags map_flags,
                             size_t offset, size_t size,
                             cl_uint num_events_in_wait_list,
                             const cl_event* event_wait_list, cl_event* event,
                             cl_int* errcode_ret) override;
    void* enqueue_map_image(cl_command_queue queue, cl_mem image,
                            cl_bool blocking_map, cl_map_flags map_flags,
                            const size_t* origin, const size_t* region,
                            size_t* image_row_pitch, size_t* image_slice_pitch,
                            cl_uint num_events_in_wait_list,
                            const cl_event* event_wait_list, cl_event* event,
                            cl_int* errcode_ret) override;
    cl_int enqueue_unmap_mem_object(cl_command_queue queue, cl_mem memobj,
                                    void* mapped_ptr,
                                    cl_uint num_events_in_wait_list,
                                    const cl_event* event_wait_list,
                                    cl_event* event) override;
    cl_int enqueue_nd_range_kernel(cl_command_queue queue, cl_kernel kernel,
                                   cl_uint work_dim,
                                   const size_t* global_work_offset,
                                   const size_t* global_work_size,
                                   const size_t* local_work_size,
                                   cl_uint num_events_in_wait_list,
                                   const cl_event* event_wait_list,
                                   cl_event* event) override;
    cl_int enqueue_marker(cl_command_queue queue, cl_event* event) override;
    cl_int enqueue_wait_for_events(cl_command_queue queue, cl_uint num_events,
                                   const cl_event* event_list) override;
    cl_int enqueue_barrier(cl_command_queue queue) override;

    cl_int enqueue_acquire_gl_objects(cl_command_queue queue,
                                      cl_uint num_objects,
                                      const cl_mem* mem_objects,
                                      cl_uint num_events_in_wait_list,
                                      const cl_event* event_wait_list,
                                      cl_event* event) override;
    cl_int enqueue_release_gl_objects(cl_command_queue queue,
                                      cl_uint num_objects,
                                      const cl_mem* mem_objects,
                                      cl_uint num_events_in_wait_list,
                                      const cl_event* event_wait_list,
                                      cl_event* event) override;

    clq_gl_sharing* gl_sharing() override {
        return m_gl_sharing ? this : nullptr;
    }

private:
    struct command {
        uint64_t seq;
        cl_command_queue queue;
        // Commands of the same queue with a lower sequence number must
        // complete first.
        uint64_t fence;
        std::vector<cl_event> deps;
        cl_event event;
        std::function<void()> action;
    };

    fake_call& record(const std::string& entry, cl_command_queue queue,
                      cl_uint num_events_in_wait_list,
                      const cl_event* event_wait_list, cl_event* event);
    cl_int take_failure(const std::string& entry);

    cl_int check_queue(cl_command_queue queue) const;
    cl_int check_mem(cl_mem mem, cl_mem_object_type type) const;
    cl_int check_wait_list(cl_uint num_events,
                           const cl_event* event_wait_list) const;
    cl_int check_image_region(cl_mem image, const size_t* origin,
                              const size_t* region) const;

    cl_int submit(cl_command_queue queue, cl_command_type type,
                  cl_uint num_events_in_wait_list,
                  const cl_event* event_wait_list, cl_event* event,
                  bool blocking, std::function<void()> action,
                  bool wait_for_all = false);
    void drain();
    bool is_ready(const command& cmd) const;

    cl_int gl_objects(const char* entry, cl_command_type type,
                      cl_command_queue queue, cl_uint num_objects,
                      const cl_mem* mem_objects,
                      cl_uint num_events_in_wait_list,
                      const cl_event* event_wait_list, cl_event* event);

    std::unique_ptr<_cl_device_id> m_device;
    std::vector<std::unique_ptr<_cl_context>> m_contexts;
    std::vector<std::unique_ptr<_cl_command_queue>> m_queues;
    std::vector<std::unique_ptr<_cl_program>> m_programs;
    std::vector<std::unique_ptr<_cl_kernel>> m_kernels;
    std::vector<std::unique_ptr<_cl_mem>> m_mems;
    std::vector<std::unique_ptr<_cl_event>> m_events;

    std::map<std::string, kernel_function> m_kernel_functions;
    std::map<std::string, cl_int> m_failures;
    std::vector<fake_call> m_calls;
    std::vector<command> m_pending;
    std::vector<cl_event> m_executed;
    uint64_t m_seq;
    cl_ulong m_clock;
    bool m_gl_sharing;
    bool m_queue_property_supported;
};
