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

// Driver backed by the OpenCL ICD loader. Every entry point forwards to the
// OpenCL API function of the same name.
struct clq_icd_driver final : public clq_driver, public clq_gl_sharing {

    // GL sharing is reported when `platform` advertises cl_khr_gl_sharing.
    explicit clq_icd_driver(cl_platform_id platform = nullptr);

    const char* name() const override { return "icd"; }

    cl_context create_context(cl_uint num_devices, const cl_device_id* devices,
                              cl_int* errcode_ret) override;
    cl_int release_context(cl_context context) override;
    cl_int get_device_info(cl_device_id device, cl_device_info param_name,
                           size_t param_value_size, void* param_value,
                           size_t* param_value_size_ret) override;

    cl_command_queue create_command_queue(
        cl_context context, cl_device_id device,
        cl_command_queue_properties properties, cl_int* errcode_ret) override;
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
                                        const size_t* region, size_t dst_offset,
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
    bool m_gl_sharing;
};
