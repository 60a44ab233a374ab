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

#include "log.hpp"
#include "config.hpp"

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <unordered_map>
#ifndef _MSC_VER
#include <unistd.h>
#endif

#ifdef WIN32
#include <io.h>
#endif

#define CASE(X)                                                                \
    case X:                                                                    \
        return #X;

static int gLoggingLevel = loglevel::error;
static uint64_t gLoggingGroupMask = loggroup::all;
static bool gLoggingColour;
static FILE* gLoggingFile;

static uint64_t init_logging_groups() {
    uint64_t mask = loggroup::all;

    static std::unordered_map<std::string, loggroup> groups{
        {"refcounting", loggroup::refcounting},
        {"api", loggroup::api},
        {"event", loggroup::event},
        {"cfg", loggroup::cfg},
        {"none", loggroup::none},
        {"all", loggroup::all},
    };

    if (config.log_groups.set) {
        std::stringstream sstr(config.log_groups());
        bool first_group_enable_seen = false;
        while (sstr.good()) {
            std::string group_endis;
            getline(sstr, group_endis, ',');
            bool is_disable = false;
            if (group_endis.rfind("-", 0) == 0) {
                group_endis.erase(0, 1);
                is_disable = true;
            }
            loggroup group;
            if (groups.count(group_endis) != 0) {
                group = groups.at(group_endis);
            } else {
                fprintf(stderr, "FATAL: Unknown log group '%s'.\n",
                        group_endis.c_str());
                exit(EXIT_FAILURE);
            }

            if (is_disable) {
                mask &= ~group;
            } else {
                if (!first_group_enable_seen) {
                    mask = 0;
                    first_group_enable_seen = true;
                }
                mask |= group;
            }
        }
    }

    return mask;
}

void init_logging() {
    if (config.log.set) {
        if (config.log > loglevel::debug) {
            fprintf(stderr, "FATAL: Unknown log level '%u'.\n", config.log());
            exit(EXIT_FAILURE);
        }
    }
    gLoggingLevel = static_cast<loglevel>(config.log());

    gLoggingGroupMask = init_logging_groups();

    if (config.log_dest.set) {

        std::string val(config.log_dest);

        if (val == "stdout") {
            gLoggingFile = stdout;
        } else if (val == "stderr") {
            gLoggingFile = stderr;
        } else if (val.rfind("file:", 0) == 0) {

            val.erase(0, strlen("file:"));

            gLoggingFile = fopen(val.c_str(), "w+");

            if (gLoggingFile == nullptr) {
                fprintf(stderr, "FATAL: Could not open log file '%s': %s.\n",
                        val.c_str(), strerror(errno));
                exit(EXIT_FAILURE);
            }
        } else {
            fprintf(stderr, "FATAL: Unknown log destination '%s'.\n",
                    val.c_str());
            exit(EXIT_FAILURE);
        }
    } else {
        gLoggingFile = stderr;
    }

    gLoggingColour = isatty(fileno(gLoggingFile));

    if (config.log_colour.set) {
        gLoggingColour = config.log_colour;
    }
}

void term_logging() {
    if ((gLoggingFile != nullptr) && (gLoggingFile != stdout) &&
        (gLoggingFile != stderr)) {
        fclose(gLoggingFile);
    }
    gLoggingFile = nullptr;
}

bool clq_log_level_enabled(loglevel level) { return gLoggingLevel >= level; }
bool clq_log_group_enabled(uint64_t group_mask) {
    return gLoggingGroupMask & group_mask;
}

static const char colourRed[] = "\e[0;31m";
static const char colourYellow[] = "\e[0;33m";
static const char colourReset[] = "\e[0m";

void clq_log(uint64_t group_mask, loglevel level, const char* fmt, ...) {

    if (!clq_log_level_enabled(level)) {
        return;
    }

    if (!clq_log_group_enabled(group_mask)) {
        return;
    }

    // Messages emitted before init_logging() go to stderr
    FILE* out = gLoggingFile != nullptr ? gLoggingFile : stderr;

    const char* colourCode = nullptr;

    if (gLoggingColour) {

        switch (level) {
        case loglevel::fatal:
        case loglevel::error:
            colourCode = colourRed;
            break;
        case loglevel::warn:
            colourCode = colourYellow;
            break;
        case loglevel::info:
        case loglevel::debug:
            break;
        }

        if (colourCode != nullptr) {
            fprintf(out, "%s", colourCode);
        }
    }

    fprintf(out, "[CLQ] ");

    va_list args;
    va_start(args, fmt);
    vfprintf(out, fmt, args);
    va_end(args);

    if ((gLoggingColour) && (colourCode != nullptr)) {
        fprintf(out, "%s", colourReset);
    }

    if (level <= loglevel::error) {
        fflush(out);
    }

    if (level == loglevel::fatal) {
        exit(EXIT_FAILURE);
    }
}

std::string pretty_size(uint64_t size) {
    std::string ret;

    static const char* units[] = {" B", "kB", "MB", "GB", "TB"};
    int unit = 0;
    float fsize = size;
    while (fsize > 1024 && unit < 4) {
        unit++;
        fsize /= 1024;
    }

    ret = std::to_string(fsize) + " " + units[unit];

    return ret;
}

// clang-format off
const char* cl_status_to_string(cl_int status) {
    switch (status) {
        CASE(CL_SUCCESS)
        CASE(CL_DEVICE_NOT_FOUND)
        CASE(CL_DEVICE_NOT_AVAILABLE)
        CASE(CL_COMPILER_NOT_AVAILABLE)
        CASE(CL_MEM_OBJECT_ALLOCATION_FAILURE)
        CASE(CL_OUT_OF_RESOURCES)
        CASE(CL_OUT_OF_HOST_MEMORY)
        CASE(CL_PROFILING_INFO_NOT_AVAILABLE)
        CASE(CL_MEM_COPY_OVERLAP)
        CASE(CL_IMAGE_FORMAT_MISMATCH)
        CASE(CL_IMAGE_FORMAT_NOT_SUPPORTED)
        CASE(CL_BUILD_PROGRAM_FAILURE)
        CASE(CL_MAP_FAILURE)
        CASE(CL_MISALIGNED_SUB_BUFFER_OFFSET)
        CASE(CL_EXEC_STATUS_ERROR_FOR_EVENTS_IN_WAIT_LIST)
        CASE(CL_INVALID_VALUE)
        CASE(CL_INVALID_DEVICE_TYPE)
        CASE(CL_INVALID_PLATFORM)
        CASE(CL_INVALID_DEVICE)
        CASE(CL_INVALID_CONTEXT)
        CASE(CL_INVALID_QUEUE_PROPERTIES)
        CASE(CL_INVALID_COMMAND_QUEUE)
        CASE(CL_INVALID_HOST_PTR)
        CASE(CL_INVALID_MEM_OBJECT)
        CASE(CL_INVALID_IMAGE_FORMAT_DESCRIPTOR)
        CASE(CL_INVALID_IMAGE_SIZE)
        CASE(CL_INVALID_SAMPLER)
        CASE(CL_INVALID_BINARY)
        CASE(CL_INVALID_BUILD_OPTIONS)
        CASE(CL_INVALID_PROGRAM)
        CASE(CL_INVALID_PROGRAM_EXECUTABLE)
        CASE(CL_INVALID_KERNEL_NAME)
        CASE(CL_INVALID_KERNEL_DEFINITION)
        CASE(CL_INVALID_KERNEL)
        CASE(CL_INVALID_ARG_INDEX)
        CASE(CL_INVALID_ARG_VALUE)
        CASE(CL_INVALID_ARG_SIZE)
        CASE(CL_INVALID_KERNEL_ARGS)
        CASE(CL_INVALID_WORK_DIMENSION)
        CASE(CL_INVALID_WORK_GROUP_SIZE)
        CASE(CL_INVALID_WORK_ITEM_SIZE)
        CASE(CL_INVALID_GLOBAL_OFFSET)
        CASE(CL_INVALID_EVENT_WAIT_LIST)
        CASE(CL_INVALID_EVENT)
        CASE(CL_INVALID_OPERATION)
        CASE(CL_INVALID_GL_OBJECT)
        CASE(CL_INVALID_BUFFER_SIZE)
        CASE(CL_INVALID_MIP_LEVEL)
        CASE(CL_INVALID_GLOBAL_WORK_SIZE)
        CASE(CL_INVALID_PROPERTY)
    default:
        return "CL_UNKNOWN_STATUS";
    }
}
// clang-format on
