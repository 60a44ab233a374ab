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

#include "memory.hpp"
#include "context.hpp"
#include "error.hpp"
#include "log.hpp"
#include "utils.hpp"

const char* map_flag_to_string(clq_map_flag flag) {
    switch (flag) {
    case clq_map_flag::read:
        return "read";
    case clq_map_flag::write:
        return "write";
    case clq_map_flag::read_write:
        return "read_write";
    }
    return "unknown";
}

clq_mem::clq_mem(clq_context* ctx, cl_mem mem, cl_mem_object_type type,
                 cl_mem_flags flags, size_t size)
    : m_context(ctx), m_driver(ctx->driver()), m_mem(mem), m_type(type),
      m_flags(flags), m_size(size) {}

clq_mem::~clq_mem() {
    if (m_mapping) {
        clq_warn("%s destroyed while mapped", to_string().c_str());
    }
    clq_debug_group(loggroup::refcounting, "releasing memory object %p",
                    m_mem);
    cl_int err = m_driver->release_mem_object(m_mem);
    if (err != CL_SUCCESS) {
        clq_error_fn("could not release memory object %p: %s", m_mem,
                     cl_status_to_string(err));
    }
}

const clq_mapping& clq_mem::mapping() const {
    if (!m_mapping) {
        throw clq_resource_state_error(to_string() + " is not mapped");
    }
    return *m_mapping;
}

std::string clq_mem::to_string() const {
    return "mem{" + pointer_to_string(m_mem) + ", size: " +
           std::to_string(m_size) + "}";
}

std::string clq_buffer::to_string() const {
    return "buffer{" + pointer_to_string(native()) +
           ", size: " + std::to_string(size()) + "}";
}

clq_image::clq_image(clq_context* ctx, cl_mem mem, cl_mem_object_type type,
                     cl_mem_flags flags, const cl_image_format& format,
                     size_t width, size_t height, size_t depth,
                     size_t row_pitch, size_t slice_pitch)
    : clq_mem(ctx, mem, type, flags,
              storage_size(format, width, height, depth, row_pitch,
                           slice_pitch)),
      m_format(format), m_width(width),
      m_height(height), m_depth(depth), m_element_size(element_size(format)),
      m_row_pitch(row_pitch != 0 ? row_pitch : width * m_element_size),
      m_slice_pitch(slice_pitch != 0 ? slice_pitch : m_row_pitch * height) {}

std::string clq_image::to_string() const {
    std::string kind = type() == CL_MEM_OBJECT_IMAGE3D ? "image3d" : "image2d";
    std::string str = kind + "{" + pointer_to_string(native()) +
                      ", width: " + std::to_string(m_width) +
                      ", height: " + std::to_string(m_height);
    if (type() == CL_MEM_OBJECT_IMAGE3D) {
        str += ", depth: " + std::to_string(m_depth);
    }
    return str + "}";
}

size_t clq_image::storage_size(const cl_image_format& format, size_t width,
                               size_t height, size_t depth, size_t row_pitch,
                               size_t slice_pitch) {
    if (row_pitch == 0) {
        row_pitch = width * element_size(format);
    }
    if (slice_pitch == 0) {
        slice_pitch = row_pitch * height;
    }
    return slice_pitch * depth;
}

size_t clq_image::element_size(const cl_image_format& format) {
    // Packed formats store all channels in a single element
    switch (format.image_channel_data_type) {
    case CL_UNORM_SHORT_565:
    case CL_UNORM_SHORT_555:
        return 2;
    case CL_UNORM_INT_101010:
        return 4;
    default:
        return num_channels(format) * element_size_per_channel(format);
    }
}

size_t clq_image::num_channels(const cl_image_format& format) {
    switch (format.image_channel_order) {
    case CL_R:
    case CL_Rx:
    case CL_A:
    case CL_INTENSITY:
    case CL_LUMINANCE:
        return 1;
    case CL_RG:
    case CL_RGx:
    case CL_RA:
        return 2;
    case CL_RGB:
    case CL_RGBx:
        return 3;
    case CL_RGBA:
    case CL_ARGB:
    case CL_BGRA:
        return 4;
    default:
        return 0;
    }
}

size_t clq_image::element_size_per_channel(const cl_image_format& format) {
    switch (format.image_channel_data_type) {
    case CL_SNORM_INT8:
    case CL_UNORM_INT8:
    case CL_SIGNED_INT8:
    case CL_UNSIGNED_INT8:
        return 1;
    case CL_SNORM_INT16:
    case CL_UNORM_INT16:
    case CL_SIGNED_INT16:
    case CL_UNSIGNED_INT16:
    case CL_HALF_FLOAT:
        return 2;
    case CL_SIGNED_INT32:
    case CL_UNSIGNED_INT32:
    case CL_FLOAT:
        return 4;
    default:
        return 0;
    }
}
