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

#include <stdexcept>
#include <string>

#include "cl_headers.hpp"

struct clq_exception : public std::runtime_error {
    explicit clq_exception(const std::string& what)
        : std::runtime_error(what) {}
};

// A driver call returned something other than CL_SUCCESS.
struct clq_command_error : public clq_exception {

    clq_command_error(const std::string& operation, cl_int status,
                      const std::string& operands);

    const std::string& operation() const { return m_operation; }
    cl_int status() const { return m_status; }
    const char* status_string() const;
    const std::string& operands() const { return m_operands; }

private:
    std::string m_operation;
    cl_int m_status;
    std::string m_operands;
};

// An object was used outside of its valid lifetime or configuration.
struct clq_resource_state_error : public clq_exception {
    explicit clq_resource_state_error(const std::string& what);
};

// An output event list has no slot left for a new event.
struct clq_capacity_error : public clq_exception {
    clq_capacity_error(const std::string& what, size_t capacity);

    size_t capacity() const { return m_capacity; }

private:
    size_t m_capacity;
};

// Throw a clq_command_error if `status` is not CL_SUCCESS.
void clq_check_status(cl_int status, const char* operation,
                      const std::string& operands);
