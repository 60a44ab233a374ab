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

#include "config.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <vector>

const config_struct config;

namespace {

std::vector<config_option> gConfigOptions = {
#define OPTION(type, name, valdef)                                             \
    {option_type<type>(), #name, &config.name, false},
#include "config.def"
#undef OPTION
};

// Helper function to trim whitespace.
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n");
    size_t last = str.find_last_not_of(" \t\n");

    if (first == std::string::npos || last == std::string::npos) {
        return "";
    }

    return str.substr(first, (last - first + 1));
}

void parse_string(void* value_ptr, const char* txt) {
    auto cfgval = static_cast<config_value<std::string>*>(value_ptr);
    cfgval->value.assign(txt);
    cfgval->set = true;
}

void parse_boolean(void* value_ptr, const char* txt) {
    auto cfgval = static_cast<config_value<bool>*>(value_ptr);
    cfgval->value = atoi(txt);
    cfgval->set = true;
}

bool parse_uint32(void* value_ptr, const char* txt) {
    auto cfgval = static_cast<config_value<uint32_t>*>(value_ptr);
    int base = 10;
    if (strlen(txt) >= 2 && txt[0] == '0' && txt[1] == 'x') {
        base = 16;
    }
    char* end;
    errno = 0;
    unsigned long val = strtoul(txt, &end, base);
    if (end == txt || *end != '\0' || errno != 0 || val > UINT32_MAX) {
        clq_warn_group_fn(loggroup::cfg, "invalid unsigned value '%s'", txt);
        return false;
    }
    cfgval->value = static_cast<uint32_t>(val);
    cfgval->set = true;
    return true;
}

static constexpr size_t txt_size = 4096;
char gTxt[txt_size];

char* print_string(const void* value_ptr) {
    auto cfgval = static_cast<const config_value<std::string>*>(value_ptr);
    snprintf(gTxt, txt_size, "'%s'", cfgval->value.c_str());
    return gTxt;
}

char* print_boolean(const void* value_ptr) {
    auto cfgval = static_cast<const config_value<bool>*>(value_ptr);
    snprintf(gTxt, txt_size, "%s", cfgval->value ? "true" : "false");
    return gTxt;
}

char* print_uint32(const void* value_ptr) {
    auto cfgval = static_cast<const config_value<uint32_t>*>(value_ptr);
    snprintf(gTxt, txt_size, "%u (0x%x)", cfgval->value, cfgval->value);
    return gTxt;
}

char* print_option(config_option_type type, const void* val) {
    switch (type) {
    case config_option_type::string:
        return print_string(val);
    case config_option_type::boolean:
        return print_boolean(val);
    case config_option_type::uint32:
        return print_uint32(val);
    }
    return nullptr;
}

void read_config_file(std::unordered_map<std::string, std::string>& umap,
                      std::ifstream& config_stream) {

    std::string line;
    while (std::getline(config_stream, line)) {
        // Ignore comments and empty lines
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (value != "") {
                umap[key] = value;
                clq_debug_group_fn(loggroup::cfg, "'%s' = '%s'", key.c_str(),
                                   value.c_str());
            }
        } else {
            clq_warn_group_fn(loggroup::cfg, "%s , %s",
                              "The following line is malformed", line.c_str());
        }
    }
    config_stream.close();
}

void parse_option(config_option& opt, const char* txt) {
    void* val = const_cast<void*>(opt.value);
    switch (opt.type) {
    case config_option_type::string:
        parse_string(val, txt);
        break;
    case config_option_type::boolean:
        parse_boolean(val, txt);
        break;
    case config_option_type::uint32:
        if (!parse_uint32(val, txt)) {
            return;
        }
        break;
    }
    opt.set = true;
}

std::string home_config_path() {
    const char* home = getenv("HOME");
    if (home == nullptr) {
        return "";
    }
    return (std::filesystem::path(home) / ".config" / "clq.conf").string();
}

void parse_config_file() {
    std::unordered_map<std::string, std::string> file_config_values;
    std::string conf_file = "clq.conf";
    std::ifstream config_stream;

    std::vector<std::string> config_file_paths;
    config_file_paths.push_back("/etc/clq.conf");
    config_file_paths.push_back("/usr/local/etc/clq.conf");
    auto home_path = home_config_path();
    if (!home_path.empty()) {
        config_file_paths.push_back(home_path);
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        config_file_paths.push_back((cwd / conf_file).string());
    }
    if (!config.config_file().empty()) {
        config_file_paths.push_back(config.config_file());
    }

    // Later files take precedence over earlier ones
    for (auto& curr_path : config_file_paths) {
        if (!std::filesystem::exists(curr_path, ec)) {
            continue;
        }
        config_stream.open(curr_path);
        if (!config_stream.is_open()) {
            clq_error("Error opening config file - %s", curr_path.c_str());
            continue;
        }
        clq_info_group_fn(loggroup::cfg, "Parsing config file '%s'",
                          curr_path.c_str());
        read_config_file(file_config_values, config_stream);
    }

    for (auto& opt : gConfigOptions) {
        if (file_config_values.find(opt.name) == file_config_values.end()) {
            continue;
        }
        if (opt.set) { // means already set by 'parse_env'
            continue;
        }
        CLQ_ASSERT(file_config_values[opt.name].length() > 0);
        parse_option(opt, file_config_values[opt.name].c_str());
    }
}

void parse_env() {
    for (auto& opt : gConfigOptions) {
        auto var_name = get_clq_env_name(opt.name);
        const char* txt = getenv(var_name.c_str());
        if (txt == nullptr) {
            continue;
        }
        clq_debug_group_fn(loggroup::cfg, "'%s' = '%s'", var_name.c_str(), txt);
        parse_option(opt, txt);
    }
}

} // namespace

std::string get_clq_env_name(const std::string& name) {
    std::string var_name = "CLQ_";
    std::string optname_upper(name);
    std::transform(optname_upper.begin(), optname_upper.end(),
                   optname_upper.begin(), ::toupper);
    var_name += optname_upper;
    return var_name;
}

void print_config() {
    clq_info_group_fn(loggroup::cfg, "");
    std::vector<config_option> options(gConfigOptions.size());
    std::partial_sort_copy(gConfigOptions.begin(), gConfigOptions.end(),
                           options.begin(), options.end(),
                           [](const config_option& a, const config_option& b) {
                               return a.name < b.name;
                           });
    for (const auto& opt : options) {
        char* txt = print_option(opt.type, opt.value);
        if (opt.set) {
            clq_info_group(loggroup::cfg, "  *%s: %s", opt.name.c_str(), txt);
        } else {
            clq_debug_group(loggroup::cfg, "  %s: %s", opt.name.c_str(), txt);
        }
    }
}

void init_config() {
    parse_env();
    parse_config_file();
}
