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
#include "driver.hpp"

#include <optional>
#include <string>

struct clq_context;

enum class clq_map_flag : cl_map_flags
{
    read = CL_MAP_READ,
    write = CL_MAP_WRITE,
    read_write = CL_MAP_READ | CL_MAP_WRITE,
};

const char* map_flag_to_string(clq_map_flag flag);

// Host window returned by a map command.
struct clq_mapping {
    void* ptr;
    size_t size;
    size_t row_pitch;
    size_t slice_pitch;
};

// One native memory allocation. The allocation belongs to the context that
// created the object and is released when the object is destroyed. Memory
// objects must not outlive the driver of their context.
struct clq_mem {

    clq_mem(clq_context* ctx, cl_mem mem, cl_mem_object_type type,
            cl_mem_flags flags, size_t size);

    virtual ~clq_mem();

    clq_mem(const clq_mem&) = delete;
    clq_mem& operator=(const clq_mem&) = delete;

    cl_mem native() const { return m_mem; }
    cl_mem_object_type type() const { return m_type; }
    cl_mem_flags flags() const { return m_flags; }
    size_t size() const { return m_size; }
    clq_context* context() const { return m_context; }

    bool is_mapped() const { return m_mapping.has_value(); }

    // The window recorded by the last successful map. Throws
    // clq_resource_state_error when the object is not mapped.
    const clq_mapping& mapping() const;

    virtual std::string to_string() const;

private:
    friend struct clq_command_queue;

    void set_mapping(const clq_mapping& mapping) { m_mapping = mapping; }
    void clear_mapping() { m_mapping.reset(); }

    clq_context* m_context;
    clq_driver* m_driver;
    cl_mem m_mem;
    cl_mem_object_type m_type;
    cl_mem_flags m_flags;
    size_t m_size;
    std::optional<clq_mapping> m_mapping;
};

struct clq_buffer final : public clq_mem {

    clq_buffer(clq_context* ctx, cl_mem mem, cl_mem_flags flags, size_t size)
        : clq_mem(ctx, mem, CL_MEM_OBJECT_BUFFER, flags, size) {}

    std::string to_string() const override;
};

struct clq_image : public clq_mem {

    const cl_image_format& format() const { return m_format; }
    size_t width() const { return m_width; }
    size_t height() const { return m_height; }
    size_t depth() const { return m_depth; }

    // Size in bytes of one pixel.
    size_t element_size() const { return m_element_size; }

    size_t row_pitch() const { return m_row_pitch; }
    size_t slice_pitch() const { return m_slice_pitch; }

    std::string to_string() const override;

    // Size in bytes of one pixel of the given format, or 0 when the format
    // is not known.
    static size_t element_size(const cl_image_format& format);

protected:
    clq_image(clq_context* ctx, cl_mem mem, cl_mem_object_type type,
              cl_mem_flags flags, const cl_image_format& format,
              size_t width, size_t height, size_t depth, size_t row_pitch,
              size_t slice_pitch);

private:
    static size_t storage_size(const cl_image_format& format, size_t width,
                               size_t height, size_t depth, size_t row_pitch,
                               size_t slice_pitch);
    static size_t num_channels(const cl_image_format& format);
    static size_t element_size_per_channel(const cl_image_format& format);

    const cl_image_format m_format;
    const size_t m_width;
    const size_t m_height;
    const size_t m_depth;
    const size_t m_element_size;
    const size_t m_row_pitch;
    const size_t m_slice_pitch;
};

struct clq_image2d final : public clq_image {
    clq_image2d(clq_context* ctx, cl_mem mem, cl_mem_flags flags,
                const cl_image_format& format, size_t width, size_t height,
                size_t row_pitch)
        : clq_image(ctx, mem, CL_MEM_OBJECT_IMAGE2D, flags, format, width,
                    height, 1, row_pitch, 0) {}
};

struct clq_image3d final : public clq_image {
    clq_image3d(clq_context* ctx, cl_mem mem, cl_mem_flags flags,
                const cl_image_format& format, size_t width, size_t height,
                size_t depth, size_t row_pitch, size_t slice_pitch)
        : clq_image(ctx, mem, CL_MEM_OBJECT_IMAGE3D, flags, format, width,
                    height, depth, row_pitch, slice_pitch) {}
};
