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

#include <cstdint>
#include <string>

enum class config_option_type
{
    string,
    uint32,
    boolean,
};

template <typename T> config_option_type option_type();
template <> inline config_option_type option_type<std::string>() {
    return config_option_type::string;
}
template <> inline config_option_type option_type<uint32_t>() {
    return config_option_type::uint32;
}
template <> inline config_option_type option_type<bool>() {
    return config_option_type::boolean;
}

struct config_option {
    config_option_type type;
    std::string name;
    const void* value;
    bool set;
};

template <typename T> struct config_value {
    explicit config_value(const char* val) : set(false), value(val) {}
    explicit config_value(uint32_t val) : set(false), value(val) {}
    explicit config_value(bool val) : set(false), value(val) {}
    bool set;
    T value;
    operator T() const { return value; }
    T& operator()() { return value; }
    const T& operator()() const { return value; }
};

struct config_struct {
#define OPTION(type, name, valdef) const config_value<type> name{valdef};
#include "config.def"
#undef OPTION
};

extern const config_struct config;

// Read the environment and configuration files. Idempotent only through
// clq_init().
extern void init_config();

// Log every option, highlighting those that were set.
extern void print_config();

// Return the environment variable name for option `name`.
std::string get_clq_env_name(const std::string& name);

template <typename T> struct clq_config_scoped_override {
    clq_config_scoped_override(const config_value<T>& cfgval, const T& newval)
        : m_value_ptr(const_cast<config_value<T>*>(&cfgval)),
          m_old_value(cfgval) {
        m_value_ptr->value = newval;
        m_value_ptr->set = true;
    }
    ~clq_config_scoped_override() { *m_value_ptr = m_old_value; }

private:
    config_value<T>* m_value_ptr;
    config_value<T> m_old_value;
};
