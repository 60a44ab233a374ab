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

#include <stdexcept>

TEST(EventList, RejectsZeroCapacity) {
    EXPECT_THROW(clq_event_list(0), std::invalid_argument);
}

TEST(EventList, DefaultCapacityComesFromConfiguration) {
    {
        clq_event_list events;
        EXPECT_EQ(events.capacity(), config.event_list_default_capacity());
    }
    {
        clq_config_scoped_override<uint32_t> cap(
            config.event_list_default_capacity, 3);
        clq_event_list events;
        EXPECT_EQ(events.capacity(), 3u);
        EXPECT_TRUE(events.empty());
    }
}

TEST(EventList, EmptyListRendering) {
    clq_event_list events(5);
    EXPECT_EQ(events.size(), 0u);
    EXPECT_FALSE(events.full());
    EXPECT_EQ(events.begin(), events.end());
    EXPECT_EQ(events.to_string(), "event_list{size: 0, capacity: 5}");
    EXPECT_THROW(events.event(0), std::out_of_range);
}

TEST_F(WithCommandQueue, FullListRejectsCommandBeforeSubmission) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(3);

    for (int i = 0; i < 3; i++) {
        queue().write_buffer(*buffer, false, data, std::nullopt, events);
    }
    EXPECT_EQ(events.size(), 3u);
    EXPECT_TRUE(events.full());

    auto writes = m_driver.num_calls("enqueue_write_buffer");
    try {
        queue().write_buffer(*buffer, false, data, std::nullopt, events);
        FAIL() << "expected a clq_capacity_error";
    } catch (const clq_capacity_error& e) {
        EXPECT_EQ(e.capacity(), 3u);
    }
    EXPECT_EQ(m_driver.num_calls("enqueue_write_buffer"), writes);
    EXPECT_EQ(events.size(), 3u);

    // A marker into a full list is rejected the same way
    EXPECT_THROW(queue().marker(events), clq_capacity_error);
    EXPECT_EQ(m_driver.num_calls("enqueue_marker"), 0u);
    Finish();
}

TEST_F(WithCommandQueue, EventsReportStatusAndType) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);

    queue().write_buffer(*buffer, false, data, std::nullopt, events);
    EXPECT_EQ(events[0].status(), CL_QUEUED);
    EXPECT_FALSE(events[0].completed());
    EXPECT_EQ(events[0].command_type(),
              static_cast<cl_command_type>(CL_COMMAND_WRITE_BUFFER));

    events[0].wait();
    EXPECT_TRUE(events[0].completed());
    EXPECT_FALSE(events[0].terminated());

    queue().copy_buffer(*buffer, *buffer, 0, 8, 8, std::nullopt, events);
    Finish();
    EXPECT_EQ(events.event(1).command_type(),
              static_cast<cl_command_type>(CL_COMMAND_COPY_BUFFER));
}

TEST_F(WithCommandQueue, IterationVisitsEveryEvent) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(4);

    queue()
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .finish();

    size_t count = 0;
    for (auto ev : events) {
        EXPECT_EQ(ev, events.ids()[count]);
        count++;
    }
    EXPECT_EQ(count, events.size());
    EXPECT_EQ(events[1].native(), events.ids()[1]);
}

TEST_F(WithCommandQueue, ReleaseDropsEveryEvent) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);

    queue()
        .write_buffer(*buffer, true, data, std::nullopt, events)
        .write_buffer(*buffer, true, data, std::nullopt, events);
    EXPECT_EQ(m_driver.live_events(), 2u);

    events.release();
    EXPECT_EQ(m_driver.live_events(), 0u);
    EXPECT_EQ(events.size(), 0u);
    EXPECT_EQ(events.capacity(), 2u);

    // The list can be filled again
    queue().write_buffer(*buffer, true, data, std::nullopt, events);
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(WithCommandQueue, DestructionReleasesEvents) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    {
        clq_event_list events(4);
        queue().write_buffer(*buffer, true, data, std::nullopt, events);
        queue().marker(events);
        EXPECT_EQ(m_driver.live_events(), 2u);
        Finish();
    }
    EXPECT_EQ(m_driver.live_events(), 0u);
}

TEST_F(WithCommandQueue, ListCanBeConditionAndOutputOfTheSameCommand) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(3);

    queue().write_buffer(*buffer, false, data, std::nullopt, events);
    queue().write_buffer(*buffer, false, data, events, events);

    auto& call = m_driver.last_call();
    ASSERT_EQ(call.num_events_in_wait_list, 1u);
    EXPECT_EQ(call.wait_list[0], events.ids()[0]);
    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(events.ids()[1], call.event);
    Finish();
}
