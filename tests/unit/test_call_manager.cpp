#include <string>
#include <gtest/gtest.h>
#include "core/errors/gatehouse_errors.hpp"
#include "session/call_manager.hpp"

namespace {

using gatehouse::core::errors::get_error;
using gatehouse::core::errors::get_value;
using gatehouse::core::errors::is_error;
using gatehouse::session::CallManager;
using gatehouse::session::CallState;

TEST(CallManagerTest, StartCallMovesToRunning) {
    CallManager manager;
    auto start = manager.start_call("c1", "read_file");
    ASSERT_FALSE(is_error(start));
    ASSERT_TRUE(get_value(start) != nullptr);
    EXPECT_FALSE(get_value(start)->load());

    auto state = manager.get_state("c1");
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), CallState::Running);
    EXPECT_EQ(manager.active_count(), 1u);
}

TEST(CallManagerTest, EmptyIdIsRejected) {
    CallManager manager;
    auto start = manager.start_call("", "read_file");
    ASSERT_TRUE(is_error(start));
    EXPECT_EQ(get_error(start).code, "invalid_call_id");
}

TEST(CallManagerTest, DuplicateInFlightIdIsRejected) {
    CallManager manager;
    ASSERT_FALSE(is_error(manager.start_call("c1", "read_file")));
    auto again = manager.start_call("c1", "write_file");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "duplicate_call_id");
}

TEST(CallManagerTest, TerminalIdCanBeReused) {
    CallManager manager;
    ASSERT_FALSE(is_error(manager.start_call("c1", "read_file")));
    ASSERT_FALSE(is_error(manager.mark_completed("c1")));

    auto again = manager.start_call("c1", "read_file");
    ASSERT_FALSE(is_error(again));
    EXPECT_EQ(get_value(manager.get_state("c1")), CallState::Running);
    EXPECT_EQ(manager.call_count(), 1u);
}

TEST(CallManagerTest, CancelSetsTokenAndState) {
    CallManager manager;
    auto start = manager.start_call("c1", "execute_command");
    ASSERT_FALSE(is_error(start));
    auto token = get_value(start);

    auto cancel = manager.cancel_call("c1");
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), CallState::Cancelled);
    EXPECT_TRUE(token->load());

    auto same_token = manager.get_cancel_token("c1");
    ASSERT_FALSE(is_error(same_token));
    EXPECT_EQ(get_value(same_token), token);
    EXPECT_EQ(manager.active_count(), 0u);
}

TEST(CallManagerTest, TerminalStatesAreFinal) {
    CallManager manager;
    ASSERT_FALSE(is_error(manager.start_call("c1", "execute_command")));
    ASSERT_FALSE(is_error(manager.mark_failed("c1", "exit 1")));

    auto completed = manager.mark_completed("c1");
    ASSERT_TRUE(is_error(completed));
    EXPECT_EQ(get_error(completed).code, "invalid_state_transition");

    auto cancel = manager.cancel_call("c1");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");
    EXPECT_EQ(get_value(manager.get_state("c1")), CallState::Failed);
}

TEST(CallManagerTest, ReleaseDropsOnlyTerminalRecords) {
    CallManager manager;
    ASSERT_FALSE(is_error(manager.start_call("c1", "read_file")));

    auto early = manager.release_call("c1");
    ASSERT_TRUE(is_error(early));
    EXPECT_EQ(get_error(early).code, "invalid_state_transition");
    EXPECT_EQ(manager.call_count(), 1u);

    ASSERT_FALSE(is_error(manager.mark_completed("c1")));
    auto released = manager.release_call("c1");
    ASSERT_FALSE(is_error(released));
    EXPECT_EQ(get_value(released), CallState::Completed);
    EXPECT_EQ(manager.call_count(), 0u);
    EXPECT_EQ(get_error(manager.release_call("c1")).code, "call_not_found");
}

TEST(CallManagerTest, UnknownIdIsReported) {
    CallManager manager;
    auto cancel = manager.cancel_call("missing");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "call_not_found");

    auto token = manager.get_cancel_token("missing");
    ASSERT_TRUE(is_error(token));
    EXPECT_EQ(get_error(token).code, "call_not_found");
}

TEST(CallManagerTest, StateNamesAreStable) {
    EXPECT_EQ(gatehouse::session::to_string(CallState::Running), "running");
    EXPECT_EQ(gatehouse::session::to_string(CallState::Cancelled), "cancelled");
}

}  // namespace
