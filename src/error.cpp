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

#include "error.hpp"
#include "log.hpp"

namespace {

std::string command_error_message(const std::string& operation, cl_int status,
                                  const std::string& operands) {
    std::string msg = "can not " + operation + ": ";
    msg += cl_status_to_string(status);
    msg += " (" + std::to_string(status) + ")";
    if (!operands.empty()) {
        msg += " with " + operands;
    }
    return msg;
}

} // namespace

clq_command_error::clq_command_error(const std::string& operation,
                                     cl_int status,
                                     const std::string& operands)
    : clq_exception(command_error_message(operation, status, operands)),
      m_operation(operation), m_status(status), m_operands(operands) {}

const char* clq_command_error::status_string() const {
    return cl_status_to_string(m_status);
}

clq_resource_state_error::clq_resource_state_error(const std::string& what)
    : clq_exception(what) {}

clq_capacity_error::clq_capacity_error(const std::string& what,
                                       size_t capacity)
    : clq_exception(what), m_capacity(capacity) {}

void clq_check_status(cl_int status, const char* operation,
                      const std::string& operands) {
    if (status == CL_SUCCESS) {
        return;
    }
    clq_command_error err(operation, status, operands);
    clq_error("%s", err.what());
    throw err;
}
