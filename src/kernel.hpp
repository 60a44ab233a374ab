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
#include "memory.hpp"

#include <string>
#include <type_traits>

struct clq_context;

// A kernel created from a program built outside of this library. The
// native kernel is released when the object is destroyed.
struct clq_kernel {

    clq_kernel(clq_context* ctx, cl_kernel kernel, const std::string& name);

    ~clq_kernel();

    clq_kernel(const clq_kernel&) = delete;
    clq_kernel& operator=(const clq_kernel&) = delete;

    cl_kernel native() const { return m_kernel; }
    const std::string& name() const { return m_name; }
    clq_context* context() const { return m_context; }

    void set_arg(cl_uint index, size_t size, const void* value);

    // Bind a memory object to a global or constant pointer argument.
    void set_arg(cl_uint index, const clq_mem& mem);

    template <typename T,
              typename = std::enable_if_t<!std::is_base_of_v<clq_mem, T>>>
    void set_arg(cl_uint index, const T& value) {
        set_arg(index, sizeof(T), &value);
    }

    // Reserve `size` bytes of local memory for a pointer argument.
    void set_local_arg(cl_uint index, size_t size) {
        set_arg(index, size, nullptr);
    }

    std::string to_string() const;

private:
    clq_context* m_context;
    clq_driver* m_driver;
    cl_kernel m_kernel;
    std::string m_name;
};
