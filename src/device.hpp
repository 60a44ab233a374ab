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

#include <string>

// A device known to the driver. Devices are discovered outside of this
// library; a clq_device only wraps the handle.
struct clq_device {

    clq_device(clq_driver* driver, cl_device_id device)
        : m_driver(driver), m_device(device) {}

    cl_device_id native() const { return m_device; }

    std::string name() const;

    // Queue modes the device supports.
    cl_command_queue_properties queue_properties() const;

    bool operator==(const clq_device& other) const {
        return m_device == other.m_device;
    }
    bool operator!=(const clq_device& other) const {
        return !(*this == other);
    }

    std::string to_string() const;

private:
    clq_driver* m_driver;
    cl_device_id m_device;
};
