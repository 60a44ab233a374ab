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

#include "testcl.hpp"

#include <cstring>

TEST_F(WithCommandQueue, MapWriteUnmapRead) {
    auto buffer = CreateBuffer(64);

    auto mapping = queue().map_buffer(*buffer, clq_map_flag::write, true);
    ASSERT_NE(mapping.ptr, nullptr);
    EXPECT_EQ(mapping.size, 64u);
    EXPECT_TRUE(buffer->is_mapped());
    EXPECT_EQ(buffer->mapping().ptr, mapping.ptr);
    EXPECT_EQ(m_driver.last_call().map_flags,
              static_cast<cl_map_flags>(CL_MAP_WRITE));

    memset(mapping.ptr, 0x3c, mapping.size);
    queue().unmap_memory(*buffer);
    EXPECT_FALSE(buffer->is_mapped());

    std::vector<unsigned char> out(64, 0);
    queue().read_buffer(*buffer, true, out.data());
    EXPECT_EQ(out, std::vector<unsigned char>(64, 0x3c));
}

TEST_F(WithCommandQueue, MapBufferRegion) {
    auto buffer = CreateBuffer(64);
    std::vector<unsigned char> data(64);
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<unsigned char>(i);
    }
    queue().write_buffer(*buffer, true, data.data());

    clq_event_list events(2);
    auto mapping = queue().map_buffer(*buffer, clq_map_flag::read, false, 16,
                                      8, std::nullopt, events);
    EXPECT_EQ(mapping.size, 8u);
    EXPECT_EQ(events.size(), 1u);
    EXPECT_EQ(m_driver.last_call().blocking, CL_FALSE);
    EXPECT_EQ(m_driver.last_call().offset, 16u);

    events[0].wait();
    EXPECT_EQ(static_cast<unsigned char*>(mapping.ptr)[0], 16);

    queue().unmap_memory(*buffer, events, events);
    EXPECT_EQ(events.size(), 2u);
    Finish();
}

TEST_F(WithCommandQueue, UnmapWithoutMapIsRejected) {
    auto buffer = CreateBuffer(16);
    auto calls = m_driver.calls().size();

    EXPECT_THROW(queue().unmap_memory(*buffer), clq_resource_state_error);
    EXPECT_EQ(m_driver.calls().size(), calls);
    EXPECT_THROW(buffer->mapping(), clq_resource_state_error);
}

TEST_F(WithCommandQueue, FailedMapLeavesObjectUnmapped) {
    auto buffer = CreateBuffer(16);

    m_driver.fail_next("enqueue_map_buffer", CL_MAP_FAILURE);
    try {
        queue().map_buffer(*buffer, clq_map_flag::read_write, true);
        FAIL() << "expected a clq_command_error";
    } catch (const clq_command_error& e) {
        EXPECT_EQ(e.status(), CL_MAP_FAILURE);
        EXPECT_EQ(e.operation(), "map buffer");
        EXPECT_NE(e.operands().find("flag: read_write"), std::string::npos);
    }
    EXPECT_FALSE(buffer->is_mapped());
}

TEST_F(WithCommandQueue, MappingTwiceIsLeftToTheDriver) {
    auto buffer = CreateBuffer(16);

    queue().map_buffer(*buffer, clq_map_flag::read, true);
    queue().map_buffer(*buffer, clq_map_flag::read, true);
    EXPECT_EQ(m_driver.num_calls("enqueue_map_buffer"), 2u);
    EXPECT_EQ(buffer->native()->map_count, 2u);
    EXPECT_TRUE(buffer->is_mapped());

    // Only the most recent window is recorded and unmapped
    queue().unmap_memory(*buffer).finish();
    EXPECT_FALSE(buffer->is_mapped());
    EXPECT_EQ(buffer->native()->map_count, 1u);
    EXPECT_THROW(queue().unmap_memory(*buffer), clq_resource_state_error);
}

TEST_F(WithCommandQueue, MapImage2D) {
    auto image = CreateImage2D(8, 4);

    auto mapping =
        queue().map_image(*image, clq_map_flag::write, true, 1, 1, 2, 2);
    auto& call = m_driver.last_call();
    EXPECT_EQ(call.entry, "enqueue_map_image");
    EXPECT_EQ(call.origin, (std::vector<size_t>{1, 1, 0}));
    EXPECT_EQ(call.region, (std::vector<size_t>{2, 2, 1}));

    EXPECT_EQ(mapping.row_pitch, 32u);
    EXPECT_EQ(mapping.slice_pitch, 0u);
    EXPECT_EQ(mapping.size, 32u + 2 * 4);

    // Write one pixel through the window and read it back
    memset(mapping.ptr, 0xff, 4);
    queue().unmap_memory(*image);

    unsigned char pixel[4] = {};
    queue().read_image(*image, true, 0, 1, 1, 1, 1, pixel);
    for (auto c : pixel) {
        EXPECT_EQ(c, 0xff);
    }
}

TEST_F(WithCommandQueue, MapImage3DWholeExtent) {
    auto image = CreateImage3D(4, 2, 3);

    auto mapping = queue().map_image(*image, clq_map_flag::read, true);
    EXPECT_EQ(m_driver.last_call().region,
              (std::vector<size_t>{4, 2, 3}));
    EXPECT_EQ(mapping.row_pitch, 16u);
    EXPECT_EQ(mapping.slice_pitch, 32u);
    EXPECT_EQ(mapping.size, 96u);
    EXPECT_EQ(image->mapping().slice_pitch, 32u);

    queue().unmap_memory(*image).finish();
}

TEST_F(WithCommandQueue, FailedUnmapKeepsWindow) {
    auto buffer = CreateBuffer(16);
    clq_event_list events(2);

    auto mapping = queue().map_buffer(*buffer, clq_map_flag::write, true);

    m_driver.fail_next("enqueue_unmap_mem_object", CL_OUT_OF_RESOURCES);
    try {
        queue().unmap_memory(*buffer, std::nullopt, events);
        FAIL() << "expected a clq_command_error";
    } catch (const clq_command_error& e) {
        EXPECT_EQ(e.status(), CL_OUT_OF_RESOURCES);
        EXPECT_EQ(e.operation(), "unmap memory");
    }
    EXPECT_TRUE(buffer->is_mapped());
    EXPECT_EQ(buffer->mapping().ptr, mapping.ptr);
    EXPECT_TRUE(events.empty());

    // The window can still be unmapped
    queue().unmap_memory(*buffer, std::nullopt, events).finish();
    EXPECT_FALSE(buffer->is_mapped());
    EXPECT_EQ(events.size(), 1u);
}
