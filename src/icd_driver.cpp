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

#include "icd_driver.hpp"
#include "log.hpp"

#include <string>

namespace {

bool platform_has_extension(cl_platform_id platform, const char* name) {
    size_t size;
    cl_int err =
        clGetPlatformInfo(platform, CL_PLATFORM_EXTENSIONS, 0, nullptr, &size);
    if (err != CL_SUCCESS) {
        clq_warn_fn("could not query platform extensions: %s",
                    cl_status_to_string(err));
        return false;
    }

    std::string extensions(size, '\0');
    err = clGetPlatformInfo(platform, CL_PLATFORM_EXTENSIONS, size,
                            &extensions[0], nullptr);
    if (err != CL_SUCCESS) {
        clq_warn_fn("could not query platform extensions: %s",
                    cl_status_to_string(err));
        return false;
    }

    // Extension names are separated by spaces
    std::string padded = " " + std::string(extensions.c_str()) + " ";
    return padded.find(" " + std::string(name) + " ") != std::string::npos;
}

} // namespace

clq_icd_driver::clq_icd_driver(cl_platform_id platform)
    : m_gl_sharing(false) {
    if (platform != nullptr) {
        m_gl_sharing = platform_has_extension(platform, "cl_khr_gl_sharing");
    }
    clq_info("ICD driver created, GL sharing %s",
             m_gl_sharing ? "supported" : "not supported");
}

cl_context clq_icd_driver::create_context(cl_uint num_devices,
                                          const cl_device_id* devices,
                                          cl_int* errcode_ret) {
    return clCreateContext(nullptr, num_devices, devices, nullptr, nullptr,
                           errcode_ret);
}

cl_int clq_icd_driver::release_context(cl_context context) {
    return clReleaseContext(context);
}

cl_int clq_icd_driver::get_device_info(cl_device_id device,
                                       cl_device_info param_name,
                                       size_t param_value_size,
                                       void* param_value,
                                       size_t* param_value_size_ret) {
    return clGetDeviceInfo(device, param_name, param_value_size, param_value,
                           param_value_size_ret);
}

cl_command_queue
clq_icd_driver::create_command_queue(cl_context context, cl_device_id device,
                                     cl_command_queue_properties properties,
                                     cl_int* errcode_ret) {
    return clCreateCommandQueue(context, device, properties, errcode_ret);
}

cl_int clq_icd_driver::set_command_queue_property(
    cl_command_queue queue, cl_command_queue_properties properties,
    cl_bool enable, cl_command_queue_properties* old_properties) {
    return clSetCommandQueueProperty(queue, properties, enable,
                                     old_properties);
}

cl_int clq_icd_driver::release_command_queue(cl_command_queue queue) {
    return clReleaseCommandQueue(queue);
}

cl_int clq_icd_driver::flush(cl_command_queue queue) { return clFlush(queue); }

cl_int clq_icd_driver::finish(cl_command_queue queue) {
    return clFinish(queue);
}

cl_mem clq_icd_driver::create_buffer(cl_context context, cl_mem_flags flags,
                                     size_t size, void* host_ptr,
                                     cl_int* errcode_ret) {
    return clCreateBuffer(context, flags, size, host_ptr, errcode_ret);
}

cl_mem clq_icd_driver::create_image(cl_context context, cl_mem_flags flags,
                                    const cl_image_format* image_format,
                                    const cl_image_desc* image_desc,
                                    void* host_ptr, cl_int* errcode_ret) {
    return clCreateImage(context, flags, image_format, image_desc, host_ptr,
                         errcode_ret);
}

cl_int clq_icd_driver::release_mem_object(cl_mem memobj) {
    return clReleaseMemObject(memobj);
}

cl_kernel clq_icd_driver::create_kernel(cl_program program,
                                        const char* kernel_name,
                                        cl_int* errcode_ret) {
    return clCreateKernel(program, kernel_name, errcode_ret);
}

cl_int clq_icd_driver::set_kernel_arg(cl_kernel kernel, cl_uint arg_index,
                                      size_t arg_size, const void* arg_value) {
    return clSetKernelArg(kernel, arg_index, arg_size, arg_value);
}

cl_int clq_icd_driver::release_kernel(cl_kernel kernel) {
    return clReleaseKernel(kernel);
}

cl_int clq_icd_driver::wait_for_events(cl_uint num_events,
                                       const cl_event* event_list) {
    return clWaitForEvents(num_events, event_list);
}

cl_int clq_icd_driver::get_event_info(cl_event event, cl_event_info param_name,
                                      size_t param_value_size,
                                      void* param_value,
                                      size_t* param_value_size_ret) {
    return clGetEventInfo(event, param_name, param_value_size, param_value,
                          param_value_size_ret);
}

cl_int clq_icd_driver::get_event_profiling_info(cl_event event,
                                                cl_profiling_info param_name,
                                                size_t param_value_size,
                                                void* param_value,
                                                size_t* param_value_size_ret) {
    return clGetEventProfilingInfo(event, param_name, param_value_size,
                                   param_value, param_value_size_ret);
}

cl_int clq_icd_driver::release_event(cl_event event) {
    return clReleaseEvent(event);
}

cl_int clq_icd_driver::enqueue_read_buffer(
    cl_command_queue queue, cl_mem buffer, cl_bool blocking_read,
    size_t offset, size_t size, void* ptr, cl_uint num_events_in_wait_list,
    const cl_event* event_wait_list, cl_event* event) {
    return clEnqueueReadBuffer(queue, buffer, blocking_read, offset, size, ptr,
                               num_events_in_wait_list, event_wait_list,
                               event);
}

cl_int clq_icd_driver::enqueue_write_buffer(
    cl_command_queue queue, cl_mem buffer, cl_bool blocking_write,
    size_t offset, size_t size, const void* ptr,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueWriteBuffer(queue, buffer, blocking_write, offset, size,
                                ptr, num_events_in_wait_list, event_wait_list,
                                event);
}

cl_int clq_icd_driver::enqueue_copy_buffer(
    cl_command_queue queue, cl_mem src_buffer, cl_mem dst_buffer,
    size_t src_offset, size_t dst_offset, size_t size,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueCopyBuffer(queue, src_buffer, dst_buffer, src_offset,
                               dst_offset, size, num_events_in_wait_list,
                               event_wait_list, event);
}

cl_int clq_icd_driver::enqueue_read_image(
    cl_command_queue queue, cl_mem image, cl_bool blocking_read,
    const size_t* origin, const size_t* region, size_t row_pitch,
    size_t slice_pitch, void* ptr, cl_uint num_events_in_wait_list,
    const cl_event* event_wait_list, cl_event* event) {
    return clEnqueueReadImage(queue, image, blocking_read, origin, region,
                              row_pitch, slice_pitch, ptr,
                              num_events_in_wait_list, event_wait_list, event);
}

cl_int clq_icd_driver::enqueue_write_image(
    cl_command_queue queue, cl_mem image, cl_bool blocking_write,
    const size_t* origin, const size_t* region, size_t input_row_pitch,
    size_t input_slice_pitch, const void* ptr, cl_uint num_events_in_wait_list,
    const cl_event* event_wait_list, cl_event* event) {
    return clEnqueueWriteImage(queue, image, blocking_write, origin, region,
                               input_row_pitch, input_slice_pitch, ptr,
                               num_events_in_wait_list, event_wait_list,
                               event);
}

cl_int clq_icd_driver::enqueue_copy_image(
    cl_command_queue queue, cl_mem src_image, cl_mem dst_image,
    const size_t* src_origin, const size_t* dst_origin, const size_t* region,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueCopyImage(queue, src_image, dst_image, src_origin,
                              dst_origin, region, num_events_in_wait_list,
                              event_wait_list, event);
}

cl_int clq_icd_driver::enqueue_copy_image_to_buffer(
    cl_command_queue queue, cl_mem src_image, cl_mem dst_buffer,
    const size_t* src_origin, const size_t* region, size_t dst_offset,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueCopyImageToBuffer(queue, src_image, dst_buffer, src_origin,
                                      region, dst_offset,
                                      num_events_in_wait_list,
                                      event_wait_list, event);
}

cl_int clq_icd_driver::enqueue_copy_buffer_to_image(
    cl_command_queue queue, cl_mem src_buffer, cl_mem dst_image,
    size_t src_offset, const size_t* dst_origin, const size_t* region,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueCopyBufferToImage(queue, src_buffer, dst_image, src_offset,
                                      dst_origin, region,
                                      num_events_in_wait_list,
                                      event_wait_list, event);
}

void* clq_icd_driver::enqueue_map_buffer(
    cl_command_queue queue, cl_mem buffer, cl_bool blocking_map,
    cl_map_flags map_flags, size_t offset, size_t size,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event, cl_int* errcode_ret) {
    return clEnqueueMapBuffer(queue, buffer, blocking_map, map_flags, offset,
                              size, num_events_in_wait_list, event_wait_list,
                              event, errcode_ret);
}

void* clq_icd_driver::enqueue_map_image(
    cl_command_queue queue, cl_mem image, cl_bool blocking_map,
    cl_map_flags map_flags, const size_t* origin, const size_t* region,
    size_t* image_row_pitch, size_t* image_slice_pitch,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event, cl_int* errcode_ret) {
    return clEnqueueMapImage(queue, image, blocking_map, map_flags, origin,
                             region, image_row_pitch, image_slice_pitch,
                             num_events_in_wait_list, event_wait_list, event,
                             errcode_ret);
}

cl_int clq_icd_driver::enqueue_unmap_mem_object(
    cl_command_queue queue, cl_mem memobj, void* mapped_ptr,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueUnmapMemObject(queue, memobj, mapped_ptr,
                                   num_events_in_wait_list, event_wait_list,
                                   event);
}

cl_int clq_icd_driver::enqueue_nd_range_kernel(
    cl_command_queue queue, cl_kernel kernel, cl_uint work_dim,
    const size_t* global_work_offset, const size_t* global_work_size,
    const size_t* local_work_size, cl_uint num_events_in_wait_list,
    const cl_event* event_wait_list, cl_event* event) {
    return clEnqueueNDRangeKernel(queue, kernel, work_dim, global_work_offset,
                                  global_work_size, local_work_size,
                                  num_events_in_wait_list, event_wait_list,
                                  event);
}

cl_int clq_icd_driver::enqueue_marker(cl_command_queue queue,
                                      cl_event* event) {
    return clEnqueueMarker(queue, event);
}

cl_int clq_icd_driver::enqueue_wait_for_events(cl_command_queue queue,
                                               cl_uint num_events,
                                               const cl_event* event_list) {
    return clEnqueueWaitForEvents(queue, num_events, event_list);
}

cl_int clq_icd_driver::enqueue_barrier(cl_command_queue queue) {
    return clEnqueueBarrier(queue);
}

cl_int clq_icd_driver::enqueue_acquire_gl_objects(
    cl_command_queue queue, cl_uint num_objects, const cl_mem* mem_objects,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueAcquireGLObjects(queue, num_objects, mem_objects,
                                     num_events_in_wait_list, event_wait_list,
                                     event);
}

cl_int clq_icd_driver::enqueue_release_gl_objects(
    cl_command_queue queue, cl_uint num_objects, const cl_mem* mem_objects,
    cl_uint num_events_in_wait_list, const cl_event* event_wait_list,
    cl_event* event) {
    return clEnqueueReleaseGLObjects(queue, num_objects, mem_objects,
                                     num_events_in_wait_list, event_wait_list,
                                     event);
}
