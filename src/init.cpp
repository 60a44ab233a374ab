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

#include "init.hpp"
#include "config.hpp"
#include "log.hpp"

clq_global_state::clq_global_state() {
    init_config();
    init_logging();
    print_config();
    clq_info("clq initialised");
}

clq_global_state::~clq_global_state() {
    clq_info("clq terminating");
    term_logging();
}

clq_global_state* get_or_init_global_state() {
    static clq_global_state state;
    return &state;
}
