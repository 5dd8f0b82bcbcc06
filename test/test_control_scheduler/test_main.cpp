#include <unity.h>
#include <string.h>

#include "Modules/Control/Scheduler/ControlScheduler.h"

void setUp() {}
void tearDown() {}

void test_empty_scheduler_never_fires()
{
    ControlScheduler s;
    ControlEvent fired;
    TEST_ASSERT_FALSE(s.hasFutureEvents());
    TEST_ASSERT_FALSE(s.attemptExecution(1000, fired));
    TEST_ASSERT_EQUAL_UINT32(0, s.firedTotal());
    TEST_ASSERT_NULL(s.lastFired());
}

void test_event_fires_at_exact_timestamp_not_before()
{
    ControlScheduler s;
    s.scheduleRead(5000);

    ControlEvent fired;
    TEST_ASSERT_FALSE(s.attemptExecution(4999, fired));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)s.pendingCount());

    TEST_ASSERT_TRUE(s.attemptExecution(5000, fired));
    TEST_ASSERT_TRUE(fired.action() == ControlAction::Read);
    TEST_ASSERT_TRUE(fired.timestampMs() == 5000);
    TEST_ASSERT_FALSE(s.hasFutureEvents());
}

void test_due_check_is_monotonic_in_time()
{
    // once due at t1, still due at any later t2
    const EpochMs t1 = 10000;
    const EpochMs t2 = 86400000;
    ControlScheduler a;
    ControlScheduler b;
    a.scheduleOn(t1);
    b.scheduleOn(t1);

    ControlEvent fired;
    TEST_ASSERT_TRUE(a.attemptExecution(t1, fired));
    TEST_ASSERT_TRUE(b.attemptExecution(t2, fired));
    TEST_ASSERT_TRUE(fired.timestampMs() == t1);
}

void test_fires_one_event_per_call_and_conserves_count()
{
    ControlScheduler s;
    s.scheduleOn(100);
    s.scheduleOff(200);
    s.scheduleRead(300);

    ControlEvent fired;
    TEST_ASSERT_TRUE(s.attemptExecution(1000, fired));
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)s.pendingCount());
    TEST_ASSERT_EQUAL_UINT16(1, s.historyCount());
    TEST_ASSERT_EQUAL_UINT32(3, (uint32_t)s.pendingCount() + s.firedTotal());

    TEST_ASSERT_TRUE(s.attemptExecution(1000, fired));
    TEST_ASSERT_TRUE(s.attemptExecution(1000, fired));
    TEST_ASSERT_FALSE(s.attemptExecution(1000, fired));
    TEST_ASSERT_EQUAL_UINT32(3, s.firedTotal());
    TEST_ASSERT_EQUAL_UINT16(3, s.historyCount());
}

void test_earliest_due_event_wins_regardless_of_insertion()
{
    ControlScheduler s;
    s.scheduleRead(200);
    s.scheduleOn(100);

    ControlEvent fired;
    TEST_ASSERT_TRUE(s.attemptExecution(500, fired));
    TEST_ASSERT_TRUE(fired.action() == ControlAction::On);
    TEST_ASSERT_TRUE(fired.timestampMs() == 100);

    const ControlEvent* left = s.pendingAt(0);
    TEST_ASSERT_NOT_NULL(left);
    TEST_ASSERT_TRUE(left->action() == ControlAction::Read);
}

void test_equal_timestamps_fire_in_insertion_order()
{
    ControlScheduler s;
    s.scheduleOff(100);
    s.scheduleOn(100);

    ControlEvent fired;
    TEST_ASSERT_TRUE(s.attemptExecution(100, fired));
    TEST_ASSERT_TRUE(fired.action() == ControlAction::Off);
    TEST_ASSERT_TRUE(s.attemptExecution(100, fired));
    TEST_ASSERT_TRUE(fired.action() == ControlAction::On);
}

void test_same_instant_poll_fires_event_once()
{
    ControlScheduler s;
    s.scheduleOn(100);

    ControlEvent fired;
    TEST_ASSERT_TRUE(s.attemptExecution(100, fired));
    TEST_ASSERT_FALSE(s.attemptExecution(100, fired));
    TEST_ASSERT_EQUAL_UINT32(1, s.firedTotal());
}

void test_duplicates_are_kept()
{
    ControlScheduler s;
    s.scheduleRead(100);
    s.scheduleRead(100);
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)s.pendingCount());

    ControlEvent fired;
    TEST_ASSERT_TRUE(s.attemptExecution(100, fired));
    TEST_ASSERT_TRUE(s.attemptExecution(100, fired));
    TEST_ASSERT_EQUAL_UINT32(2, s.firedTotal());
}

void test_history_is_bounded_and_keeps_newest()
{
    ControlScheduler s;
    s.setHistoryLimit(2);
    s.scheduleRead(1);
    s.scheduleRead(2);
    s.scheduleRead(3);

    ControlEvent fired;
    while (s.attemptExecution(10, fired)) {}

    TEST_ASSERT_EQUAL_UINT16(2, s.historyCount());
    TEST_ASSERT_EQUAL_UINT32(3, s.firedTotal());
    TEST_ASSERT_TRUE(s.historyAt(0)->timestampMs() == 2);
    TEST_ASSERT_TRUE(s.historyAt(1)->timestampMs() == 3);
    TEST_ASSERT_TRUE(s.lastFired()->timestampMs() == 3);
    TEST_ASSERT_NULL(s.historyAt(2));
}

void test_history_limit_zero_disables_retention()
{
    ControlScheduler s;
    s.setHistoryLimit(0);
    s.scheduleOn(1);

    ControlEvent fired;
    TEST_ASSERT_TRUE(s.attemptExecution(1, fired));
    TEST_ASSERT_EQUAL_UINT16(0, s.historyCount());
    TEST_ASSERT_EQUAL_UINT32(1, s.firedTotal());
    TEST_ASSERT_FALSE(s.annotateLastFired("1.0"));
}

void test_history_limit_is_clamped()
{
    ControlScheduler s;
    s.setHistoryLimit(1000);
    TEST_ASSERT_EQUAL_UINT16(Limits::Control::MaxHistory, s.historyLimit());
}

void test_annotate_last_fired_attaches_sample()
{
    ControlScheduler s;
    s.scheduleRead(1);

    ControlEvent fired;
    TEST_ASSERT_TRUE(s.attemptExecution(1, fired));
    TEST_ASSERT_FALSE(s.lastFired()->hasValue());
    TEST_ASSERT_TRUE(s.annotateLastFired("69.0"));
    TEST_ASSERT_TRUE(s.lastFired()->hasValue());
    TEST_ASSERT_EQUAL_STRING("69.0", s.lastFired()->value());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_empty_scheduler_never_fires);
    RUN_TEST(test_event_fires_at_exact_timestamp_not_before);
    RUN_TEST(test_due_check_is_monotonic_in_time);
    RUN_TEST(test_fires_one_event_per_call_and_conserves_count);
    RUN_TEST(test_earliest_due_event_wins_regardless_of_insertion);
    RUN_TEST(test_equal_timestamps_fire_in_insertion_order);
    RUN_TEST(test_same_instant_poll_fires_event_once);
    RUN_TEST(test_duplicates_are_kept);
    RUN_TEST(test_history_is_bounded_and_keeps_newest);
    RUN_TEST(test_history_limit_zero_disables_retention);
    RUN_TEST(test_history_limit_is_clamped);
    RUN_TEST(test_annotate_last_fired_attaches_sample);
    return UNITY_END();
}
