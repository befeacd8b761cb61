/**
 * @file test_task_queue.cpp
 * @brief Priority order, state machine and retention of submitted tasks
 */

#include <gtest/gtest.h>
#include <distributed/task_queue.hpp>
#include "../support/manual_clock.hpp"
#include <stdexcept>

using namespace Synod;
using Synod::testing::ManualClock;

static DistributedReasoningTask make_task(const std::string& id, TaskPriority priority = TaskPriority::Medium) {
    DistributedReasoningTask t;
    t.id = id;
    t.priority = priority;
    t.query.type = "deductive";
    return t;
}

class TaskQueueTest : public ::testing::Test {
protected:
    ManualClock clock;
    TaskQueue queue{clock.fn()};
};

TEST_F(TaskQueueTest, EnqueueStampsTimesAndSequence) {
    queue.enqueue(make_task("t1"));
    queue.enqueue(make_task("t2"));

    auto t1 = queue.get_task("t1");
    auto t2 = queue.get_task("t2");
    ASSERT_TRUE(t1 && t2);
    EXPECT_EQ(t1->created_at, clock.now());
    EXPECT_EQ(t1->updated_at, t1->created_at);
    EXPECT_LT(t1->sequence, t2->sequence);
    EXPECT_EQ(queue.pending_count(), 2u);
}

TEST_F(TaskQueueTest, EnqueueRejectsBadTasks) {
    EXPECT_THROW(queue.enqueue(make_task("")), std::invalid_argument);

    queue.enqueue(make_task("t1"));
    EXPECT_THROW(queue.enqueue(make_task("t1")), std::invalid_argument);

    auto running = make_task("t2");
    running.status = TaskStatus::Running;
    EXPECT_THROW(queue.enqueue(running), std::invalid_argument);

    EXPECT_EQ(queue.get_stats().total, 1u);
}

TEST_F(TaskQueueTest, DequeuesByPriorityThenAge) {
    queue.enqueue(make_task("low", TaskPriority::Low));
    clock.advance(10);
    queue.enqueue(make_task("medium-old", TaskPriority::Medium));
    clock.advance(10);
    queue.enqueue(make_task("critical", TaskPriority::Critical));
    queue.enqueue(make_task("medium-new", TaskPriority::Medium));

    std::vector<std::string> order;
    while (auto t = queue.dequeue()) order.push_back(t->id);

    EXPECT_EQ(order, (std::vector<std::string>{"critical", "medium-old", "medium-new", "low"}));
    EXPECT_EQ(queue.pending_count(), 0u);
    // Dequeued tasks remain tracked
    EXPECT_TRUE(queue.get_task("low").has_value());
}

TEST_F(TaskQueueTest, SameInstantFallsBackToSubmissionOrder) {
    queue.enqueue(make_task("a"));
    queue.enqueue(make_task("b"));
    queue.enqueue(make_task("c"));

    EXPECT_EQ(queue.dequeue()->id, "a");
    EXPECT_EQ(queue.dequeue()->id, "b");
    EXPECT_EQ(queue.dequeue()->id, "c");
    EXPECT_FALSE(queue.dequeue().has_value());
}

TEST_F(TaskQueueTest, DequeueIfOnlyTakesTheHead) {
    queue.enqueue(make_task("a", TaskPriority::High));
    queue.enqueue(make_task("b"));

    EXPECT_EQ(queue.front_id(), std::optional<std::string>("a"));
    EXPECT_FALSE(queue.dequeue_if("b").has_value());
    EXPECT_EQ(queue.dequeue_if("a")->id, "a");
    EXPECT_EQ(queue.front_id(), std::optional<std::string>("b"));
}

TEST_F(TaskQueueTest, UpdateFollowsStateMachine) {
    queue.enqueue(make_task("t"));

    EXPECT_FALSE(queue.update_task("t", {TaskStatus::Running, {}, {}, {}}));
    EXPECT_TRUE(queue.update_task("t", {TaskStatus::Assigned, std::vector<std::string>{"n1", "n2"}, {}, {}}));
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_TRUE(queue.update_task("t", {TaskStatus::Running, {}, {}, {}}));
    EXPECT_TRUE(queue.update_task("t", {TaskStatus::Completed, {}, {}, {}}));

    // Terminal states are final
    EXPECT_FALSE(queue.update_task("t", {TaskStatus::Cancelled, {}, {}, {}}));
    EXPECT_FALSE(queue.update_task("t", {TaskStatus::Failed, {}, std::string("late"), {}}));

    auto t = queue.get_task("t");
    EXPECT_EQ(t->status, TaskStatus::Completed);
    EXPECT_FALSE(t->error.has_value());
    EXPECT_EQ(t->assigned_nodes.size(), 2u);
}

TEST_F(TaskQueueTest, CancelPendingRemovesFromOrder) {
    queue.enqueue(make_task("a"));
    queue.enqueue(make_task("b"));

    EXPECT_TRUE(queue.update_task("a", {TaskStatus::Cancelled, {}, {}, {}}));
    EXPECT_EQ(queue.pending_count(), 1u);
    EXPECT_EQ(queue.front_id(), std::optional<std::string>("b"));
}

TEST_F(TaskQueueTest, UpdateUnknownTaskFails) {
    EXPECT_FALSE(queue.update_task("missing", {TaskStatus::Cancelled, {}, {}, {}}));
}

TEST_F(TaskQueueTest, UpdateRefreshesTimestamp) {
    queue.enqueue(make_task("t"));
    clock.advance(250);
    queue.update_task("t", {std::nullopt, std::vector<std::string>{"n1"}, {}, {}});

    auto t = queue.get_task("t");
    EXPECT_EQ(t->updated_at, clock.now());
    EXPECT_EQ(t->status, TaskStatus::Pending);
}

TEST_F(TaskQueueTest, TasksAssignedToSkipsTerminal) {
    queue.enqueue(make_task("a"));
    queue.enqueue(make_task("b"));
    queue.enqueue(make_task("c"));
    queue.update_task("a", {TaskStatus::Assigned, std::vector<std::string>{"n1"}, {}, {}});
    queue.update_task("b", {TaskStatus::Assigned, std::vector<std::string>{"n1", "n2"}, {}, {}});
    queue.update_task("c", {TaskStatus::Assigned, std::vector<std::string>{"n2"}, {}, {}});
    queue.update_task("a", {TaskStatus::Failed, {}, std::string("x"), {}});

    EXPECT_EQ(queue.tasks_assigned_to("n1"), std::vector<std::string>{"b"});
    EXPECT_EQ(queue.tasks_assigned_to("n2"), (std::vector<std::string>{"b", "c"}));
    EXPECT_TRUE(queue.tasks_assigned_to("n3").empty());
}

TEST_F(TaskQueueTest, CleanupEvictsOldTerminalTasks) {
    queue.enqueue(make_task("done"));
    queue.enqueue(make_task("open"));
    queue.update_task("done", {TaskStatus::Cancelled, {}, {}, {}});

    clock.advance(1000);
    EXPECT_EQ(queue.cleanup(1000), 0u);
    clock.advance(1);
    EXPECT_EQ(queue.cleanup(1000), 1u);

    EXPECT_FALSE(queue.get_task("done").has_value());
    EXPECT_TRUE(queue.get_task("open").has_value());
}

TEST_F(TaskQueueTest, StatsCountByStatus) {
    queue.enqueue(make_task("a"));
    queue.enqueue(make_task("b"));
    queue.enqueue(make_task("c"));
    queue.update_task("a", {TaskStatus::Assigned, {}, {}, {}});
    queue.update_task("b", {TaskStatus::Failed, {}, {}, {}});

    auto stats = queue.get_stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.count(TaskStatus::Pending), 1u);
    EXPECT_EQ(stats.count(TaskStatus::Assigned), 1u);
    EXPECT_EQ(stats.count(TaskStatus::Failed), 1u);
    EXPECT_EQ(stats.count(TaskStatus::Completed), 0u);
}

TEST(TaskStateMachineTest, Transitions) {
    EXPECT_TRUE(can_transition(TaskStatus::Pending, TaskStatus::Assigned));
    EXPECT_TRUE(can_transition(TaskStatus::Assigned, TaskStatus::Timeout));
    EXPECT_TRUE(can_transition(TaskStatus::Running, TaskStatus::Failed));
    EXPECT_TRUE(can_transition(TaskStatus::Pending, TaskStatus::Cancelled));
    EXPECT_FALSE(can_transition(TaskStatus::Pending, TaskStatus::Completed));
    EXPECT_FALSE(can_transition(TaskStatus::Timeout, TaskStatus::Running));
    EXPECT_FALSE(can_transition(TaskStatus::Cancelled, TaskStatus::Cancelled));
}
