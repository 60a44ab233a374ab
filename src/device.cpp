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

#include "device.hpp"
#include "error.hpp"
#include "utils.hpp"

#include <vector>

std::string clq_device::name() const {
    size_t size;
    cl_int err =
        m_driver->get_device_info(m_device, CL_DEVICE_NAME, 0, nullptr, &size);
    clq_check_status(err, "query device name size", to_string());

    std::vector<char> name(size + 1, '\0');
    err = m_driver->get_device_info(m_device, CL_DEVICE_NAME, size,
                                    name.data(), nullptr);
    clq_check_status(err, "query device name", to_string());

    return name.data();
}

cl_command_queue_properties clq_device::queue_properties() const {
    cl_command_queue_properties props;
    cl_int err = m_driver->get_device_info(m_device, CL_DEVICE_QUEUE_PROPERTIES,
                                           sizeof(props), &props, nullptr);
    clq_check_status(err, "query device queue properties", to_string());
    return props;
}

std::string clq_device::to_string() const {
    return "device{" + pointer_to_string(m_device) + "}";
}
