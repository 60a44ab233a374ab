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

TEST_F(WithOutOfOrderCommandQueue, IndependentCommandsRunInAnyOrder) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);

    queue()
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .write_buffer(*buffer, false, data, std::nullopt, events);
    Finish();

    // The fake driver runs the newest ready command first
    ASSERT_EQ(m_driver.executed().size(), 2u);
    EXPECT_EQ(m_driver.executed()[0], events.ids()[1]);
    EXPECT_GT(Timestamp(events, 0, CL_PROFILING_COMMAND_START),
              Timestamp(events, 1, CL_PROFILING_COMMAND_END));
}

TEST_F(WithOutOfOrderCommandQueue, ConditionOrdersCommands) {
    auto src = CreateBuffer(16);
    auto dst = CreateBuffer(16);
    std::vector<unsigned char> data(16, 0x42);
    clq_event_list written(1);
    clq_event_list copied(1);

    queue()
        .write_buffer(*src, false, data.data(), std::nullopt, written)
        .copy_buffer(*src, *dst, written, copied);

    auto& call = m_driver.last_call();
    ASSERT_EQ(call.num_events_in_wait_list, 1u);
    EXPECT_EQ(call.wait_list[0], written.ids()[0]);

    Finish();
    EXPECT_GE(Timestamp(copied, 0, CL_PROFILING_COMMAND_START),
              Timestamp(written, 0, CL_PROFILING_COMMAND_END));
    EXPECT_EQ(Contents(*dst), data);
}

TEST_F(WithOutOfOrderCommandQueue, MarkerCompletesAfterPreviousCommands) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(3);

    queue()
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .marker(events);
    EXPECT_EQ(events.size(), 3u);
    EXPECT_EQ(events[2].command_type(),
              static_cast<cl_command_type>(CL_COMMAND_MARKER));

    events[2].wait();
    EXPECT_TRUE(events[0].completed());
    EXPECT_TRUE(events[1].completed());
    auto marker_start = Timestamp(events, 2, CL_PROFILING_COMMAND_START);
    EXPECT_GE(marker_start, Timestamp(events, 0, CL_PROFILING_COMMAND_END));
    EXPECT_GE(marker_start, Timestamp(events, 1, CL_PROFILING_COMMAND_END));
}

TEST_F(WithOutOfOrderCommandQueue, BarrierOrdersCommands) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);

    queue()
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .barrier()
        .write_buffer(*buffer, false, data, std::nullopt, events);
    EXPECT_EQ(m_driver.num_calls("enqueue_barrier"), 1u);
    Finish();

    ASSERT_EQ(m_driver.executed().size(), 2u);
    EXPECT_EQ(m_driver.executed()[0], events.ids()[0]);
    EXPECT_GE(Timestamp(events, 1, CL_PROFILING_COMMAND_START),
              Timestamp(events, 0, CL_PROFILING_COMMAND_END));
}

TEST_F(WithCommandQueue, BlockingWaitForEvent) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);

    queue()
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .write_buffer(*buffer, false, data, std::nullopt, events);
    EXPECT_EQ(m_driver.pending_commands(), 2u);

    queue().wait_for_event(events, 1, true);
    auto& call = m_driver.last_call();
    EXPECT_EQ(call.entry, "wait_for_events");
    ASSERT_EQ(call.num_events_in_wait_list, 1u);
    EXPECT_EQ(call.wait_list[0], events.ids()[1]);
    EXPECT_TRUE(events[1].completed());
}

TEST_F(WithOutOfOrderCommandQueue, NonBlockingWaitForEvent) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);

    queue().write_buffer(*buffer, false, data, std::nullopt, events);
    queue().wait_for_event(events, 0, false);
    EXPECT_EQ(m_driver.last_call().entry, "enqueue_wait_for_events");
    EXPECT_EQ(m_driver.num_calls("wait_for_events"), 0u);
    EXPECT_FALSE(events[0].completed());

    // Commands enqueued after the wait start after the event completed
    queue().write_buffer(*buffer, false, data, std::nullopt, events);
    Finish();
    EXPECT_GE(Timestamp(events, 1, CL_PROFILING_COMMAND_START),
              Timestamp(events, 0, CL_PROFILING_COMMAND_END));
}

TEST_F(WithCommandQueue, WaitForEventOutOfRange) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(4);
    queue().write_buffer(*buffer, true, data, std::nullopt, events);

    auto calls = m_driver.calls().size();
    EXPECT_THROW(queue().wait_for_event(events, 1, true), std::out_of_range);
    EXPECT_THROW(queue().wait_for_event(events, 4, false), std::out_of_range);
    EXPECT_EQ(m_driver.calls().size(), calls);
}

TEST_F(WithCommandQueue, WaitForEvents) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);

    queue()
        .write_buffer(*buffer, false, data, std::nullopt, events)
        .copy_buffer(*buffer, *buffer, 0, 8, 8, std::nullopt, events)
        .wait_for_events(events, true);

    auto& call = m_driver.last_call();
    EXPECT_EQ(call.entry, "wait_for_events");
    EXPECT_EQ(call.num_events_in_wait_list, 2u);
    EXPECT_TRUE(events[0].completed());
    EXPECT_TRUE(events[1].completed());
    EXPECT_EQ(m_driver.pending_commands(), 0u);
}

TEST_F(WithCommandQueue, WaitForEventsFailure) {
    clq_event_list events(1);

    // Waiting on an empty list is rejected by the driver
    try {
        queue().wait_for_events(events, false);
        FAIL() << "expected a clq_command_error";
    } catch (const clq_command_error& e) {
        EXPECT_EQ(e.status(), CL_INVALID_VALUE);
        EXPECT_EQ(e.operation(), "wait for events");
    }
}

TEST_F(WithCommandQueue, ConditionOnEventsFromAnotherQueue) {
    auto other = m_context->create_command_queue(device());
    auto buffer = CreateBuffer(16);
    std::vector<unsigned char> data(16, 7);
    clq_event_list written(1);
    clq_event_list read(1);
    std::vector<unsigned char> out(16, 0);

    other->write_buffer(*buffer, false, data.data(), std::nullopt, written);
    queue().read_buffer(*buffer, false, out.data(), written, read);
    Finish();

    ASSERT_EQ(m_driver.executed().size(), 2u);
    EXPECT_EQ(m_driver.executed()[0], written.ids()[0]);
    EXPECT_EQ(out, data);
}

TEST_F(WithCommandQueue, FailedMarkerLeavesListUnchanged) {
    auto buffer = CreateBuffer(16);
    unsigned char data[16] = {};
    clq_event_list events(2);
    queue().write_buffer(*buffer, false, data, std::nullopt, events);

    m_driver.fail_next("enqueue_marker", CL_OUT_OF_HOST_MEMORY);
    try {
        queue().marker(events);
        FAIL() << "expected a clq_command_error";
    } catch (const clq_command_error& e) {
        EXPECT_EQ(e.status(), CL_OUT_OF_HOST_MEMORY);
        EXPECT_EQ(e.operation(), "enqueue marker");
    }
    EXPECT_EQ(events.size(), 1u);

    // The queue is still usable
    queue().marker(events);
    EXPECT_EQ(events.size(), 2u);
    Finish();
    EXPECT_TRUE(events[1].completed());
}

TEST_F(WithCommandQueue, FailedBarrier) {
    m_driver.fail_next("enqueue_barrier", CL_OUT_OF_RESOURCES);
    try {
        queue().barrier();
        FAIL() << "expected a clq_command_error";
    } catch (const clq_command_error& e) {
        EXPECT_EQ(e.status(), CL_OUT_OF_RESOURCES);
        EXPECT_EQ(e.operation(), "enqueue barrier");
    }
    queue().barrier().finish();
    EXPECT_EQ(m_driver.num_calls("enqueue_barrier"), 2u);
}
