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

#include "icd_driver.hpp"

#include "gtest/gtest.h"

TEST(IcdDriver, NoGLSharingWithoutPlatform) {
    clq_icd_driver driver;
    EXPECT_STREQ(driver.name(), "icd");
    EXPECT_EQ(driver.gl_sharing(), nullptr);
}
