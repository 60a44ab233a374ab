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

#include "kernel.hpp"
#include "context.hpp"
#include "error.hpp"
#include "log.hpp"
#include "memory.hpp"
#include "utils.hpp"

clq_kernel::clq_kernel(clq_context* ctx, cl_kernel kernel,
                       const std::string& name)
    : m_context(ctx), m_driver(ctx->driver()), m_kernel(kernel), m_name(name) {}

clq_kernel::~clq_kernel() {
    clq_debug_group(loggroup::refcounting, "releasing kernel %p (%s)", m_kernel,
                    m_name.c_str());
    cl_int err = m_driver->release_kernel(m_kernel);
    if (err != CL_SUCCESS) {
        clq_error_fn("could not release kernel %s: %s", m_name.c_str(),
                     cl_status_to_string(err));
    }
}

void clq_kernel::set_arg(cl_uint index, size_t size, const void* value) {
    cl_int err = m_driver->set_kernel_arg(m_kernel, index, size, value);
    clq_check_status(err, "set kernel argument",
                     to_string() + " index: " + std::to_string(index) +
                         " size: " + std::to_string(size));
}

void clq_kernel::set_arg(cl_uint index, const clq_mem& mem) {
    cl_mem handle = mem.native();
    set_arg(index, sizeof(handle), &handle);
}

std::string clq_kernel::to_string() const {
    return "kernel{" + pointer_to_string(m_kernel) + ", " + m_name + "}";
}
