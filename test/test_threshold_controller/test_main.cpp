#include <unity.h>
#include <memory>

#include "Core/TimeUtil.h"
#include "Modules/Control/Controllers/ThresholdController.h"
#include "Modules/Control/IO/CachedInput.h"
#include "Modules/Control/IO/CallbackInput.h"
#include "Modules/Control/IO/CallbackOutput.h"

struct OutputRecorder {
    int onCalls = 0;
    int offCalls = 0;
    bool fail = false;
};

static bool recordWrite(void* ctx, bool on)
{
    OutputRecorder* r = static_cast<OutputRecorder*>(ctx);
    if (on) ++r->onCalls; else ++r->offCalls;
    return !r->fail;
}

static bool failingRead(void*, char*, size_t)
{
    return false;
}

class InjectableThresholdController : public ThresholdController {
public:
    using ThresholdController::ThresholdController;
    void injectOn(EpochMs t) { scheduler_.scheduleOn(t); }
    void injectOff(EpochMs t) { scheduler_.scheduleOff(t); }
};

static const int64_t kInterval = 5 * 60 * 1000;
static const EpochMs kT0 = TimeUtil::fromUtc(2021, 1, 1, 4, 59, 59);

static OutputRecorder rec;
static CachedInput* input = nullptr;
static std::unique_ptr<ThresholdController> ctrl;

static void build(float threshold, bool inverted, const char* initial)
{
    ThresholdConfig cfg;
    cfg.name = "heater";
    cfg.threshold = threshold;
    cfg.inverted = inverted;
    cfg.intervalMs = kInterval;

    input = new CachedInput("temp", initial);
    ctrl.reset(new ThresholdController(cfg,
                                       std::unique_ptr<ControlInput>(input),
                                       std::unique_ptr<ControlOutput>(new CallbackOutput("relay", recordWrite, &rec))));
}

void setUp()
{
    rec = OutputRecorder{};
    input = nullptr;
    ctrl.reset();
}

void tearDown()
{
    ctrl.reset();
}

void test_poll_before_start_is_not_ready_fault()
{
    build(70.0f, false, "69.0");
    ControlMessage msg;
    TEST_ASSERT_FALSE(ctrl->isStarted());
    TEST_ASSERT_TRUE(ctrl->poll(kT0, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(ctrl->lastError() == ErrorCode::NotReady);
    TEST_ASSERT_EQUAL_INT(0, rec.onCalls + rec.offCalls);
}

void test_start_arms_first_read_one_interval_later()
{
    build(70.0f, false, "69.0");
    TEST_ASSERT_TRUE(ctrl->start(kT0));
    TEST_ASSERT_TRUE(ctrl->isStarted());
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)ctrl->scheduler().pendingCount());
    TEST_ASSERT_TRUE(ctrl->scheduler().pendingAt(0)->timestampMs() == kT0 + kInterval);

    // second start is a no-op
    TEST_ASSERT_TRUE(ctrl->start(kT0 + 1000));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)ctrl->scheduler().pendingCount());

    ControlMessage msg;
    TEST_ASSERT_TRUE(ctrl->poll(kT0, msg) == PollStatus::Idle);
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + kInterval - 1, msg) == PollStatus::Idle);
}

void test_above_threshold_activates_and_reports_sample()
{
    build(5.0f, false, "10");
    ctrl->start(kT0);

    ControlMessage msg;
    const EpochMs due = kT0 + kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(due, msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_INT(1, rec.onCalls);
    TEST_ASSERT_TRUE(ctrl->output()->state());

    TEST_ASSERT_TRUE(msg == ControlMessage("heater", "Above Threshold", due, "10"));
    TEST_ASSERT_EQUAL_STRING("10", ctrl->scheduler().lastFired()->value());
}

void test_equal_value_is_below_non_inverted()
{
    build(70.0f, false, "70.0");
    ctrl->start(kT0);

    ControlMessage msg;
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_STRING("Below Threshold", msg.content());
    TEST_ASSERT_EQUAL_INT(1, rec.offCalls);
    TEST_ASSERT_FALSE(ctrl->output()->state());
}

void test_equal_value_is_below_inverted_activates()
{
    build(70.0f, true, "70.0");
    ctrl->start(kT0);

    ControlMessage msg;
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_STRING("Below Threshold", msg.content());
    TEST_ASSERT_EQUAL_INT(1, rec.onCalls);
    TEST_ASSERT_TRUE(ctrl->output()->state());
}

void test_inverted_above_deactivates()
{
    build(70.0f, true, "75.5");
    ctrl->start(kT0);

    ControlMessage msg;
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_STRING("Above Threshold", msg.content());
    TEST_ASSERT_FALSE(ctrl->output()->state());
}

void test_value_sequence_toggles_output()
{
    build(5.0f, false, "0");
    ctrl->start(kT0);

    ControlMessage msg;
    EpochMs t = kT0 + kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fired);
    TEST_ASSERT_FALSE(ctrl->output()->state());

    input->update("10");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->output()->state());
    TEST_ASSERT_EQUAL_STRING("10", msg.readState());

    input->update("0");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fired);
    TEST_ASSERT_FALSE(ctrl->output()->state());
    TEST_ASSERT_EQUAL_UINT32(3, ctrl->scheduler().firedTotal());
}

void test_late_poll_reschedules_from_poll_time()
{
    build(5.0f, false, "1");
    ctrl->start(kT0);

    ControlMessage msg;
    const EpochMs late = kT0 + kInterval + 42000;
    TEST_ASSERT_TRUE(ctrl->poll(late, msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(msg.timestampMs() == late);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)ctrl->scheduler().pendingCount());
    TEST_ASSERT_TRUE(ctrl->scheduler().pendingAt(0)->timestampMs() == late + kInterval);
}

void test_same_instant_second_poll_is_idle()
{
    build(5.0f, false, "10");
    ctrl->start(kT0);

    ControlMessage msg;
    const EpochMs due = kT0 + kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(due, msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->poll(due, msg) == PollStatus::Idle);
    TEST_ASSERT_EQUAL_INT(1, rec.onCalls);
}

void test_malformed_reading_is_recoverable()
{
    build(5.0f, false, "not-a-number");
    ctrl->start(kT0);

    ControlMessage msg;
    const EpochMs due = kT0 + kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(due, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(ctrl->lastError() == ErrorCode::BadReading);
    TEST_ASSERT_FALSE(ctrl->output()->hasState());
    TEST_ASSERT_EQUAL_INT(0, rec.onCalls + rec.offCalls);

    // next read still armed
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)ctrl->scheduler().pendingCount());
    TEST_ASSERT_TRUE(ctrl->scheduler().pendingAt(0)->timestampMs() == due + kInterval);
    TEST_ASSERT_EQUAL_STRING("not-a-number", ctrl->scheduler().lastFired()->value());

    input->update("6.5");
    TEST_ASSERT_TRUE(ctrl->poll(due + kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->output()->state());
}

void test_on_off_events_are_unexpected_and_not_rearmed()
{
    ThresholdConfig cfg;
    cfg.name = "heater";
    cfg.threshold = 70.0f;
    cfg.intervalMs = kInterval;
    InjectableThresholdController c(cfg,
                                    std::unique_ptr<ControlInput>(new CachedInput("temp", "69.0")),
                                    std::unique_ptr<ControlOutput>(new CallbackOutput("relay", recordWrite, &rec)));
    TEST_ASSERT_TRUE(c.start(kT0));
    c.injectOn(kT0 + 1000);
    c.injectOff(kT0 + 2000);
    TEST_ASSERT_EQUAL_UINT32(3, (uint32_t)c.scheduler().pendingCount());

    ControlMessage msg;
    TEST_ASSERT_TRUE(c.poll(kT0 + 1000, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(c.lastError() == ErrorCode::UnexpectedAction);
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)c.scheduler().pendingCount());

    TEST_ASSERT_TRUE(c.poll(kT0 + 2000, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(c.lastError() == ErrorCode::UnexpectedAction);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)c.scheduler().pendingCount());
    TEST_ASSERT_TRUE(c.scheduler().pendingAt(0)->timestampMs() == kT0 + kInterval);

    TEST_ASSERT_EQUAL_INT(0, rec.onCalls + rec.offCalls);
    TEST_ASSERT_FALSE(c.output()->hasState());
}

void test_reading_parse_rules()
{
    ControlMessage msg;
    EpochMs t = kT0 + kInterval;

    build(5.0f, false, " 7.25\n");
    ctrl->start(kT0);
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fired);

    input->update("12abc");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(ctrl->lastError() == ErrorCode::BadReading);

    input->update("0x1A");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(ctrl->lastError() == ErrorCode::BadReading);

    input->update(" -0X10");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fault);

    input->update("nan");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fault);

    input->update("");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fault);

    input->update("-1e2");
    t += kInterval;
    TEST_ASSERT_TRUE(ctrl->poll(t, msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_STRING("Below Threshold", msg.content());
}

void test_input_failure_is_io_error_and_rearms()
{
    ThresholdConfig cfg;
    cfg.name = "broken";
    cfg.intervalMs = kInterval;
    ThresholdController c(cfg,
                          std::unique_ptr<ControlInput>(new CallbackInput("temp", failingRead, nullptr)),
                          std::unique_ptr<ControlOutput>(new CallbackOutput("relay", recordWrite, &rec)));
    c.start(kT0);

    ControlMessage msg;
    TEST_ASSERT_TRUE(c.poll(kT0 + kInterval, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(c.lastError() == ErrorCode::IoError);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)c.scheduler().pendingCount());
    TEST_ASSERT_FALSE(c.input()->hasState());
}

void test_output_failure_is_io_error()
{
    build(5.0f, false, "10");
    rec.fail = true;
    ctrl->start(kT0);

    ControlMessage msg;
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + kInterval, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(ctrl->lastError() == ErrorCode::IoError);
    TEST_ASSERT_EQUAL_INT(1, rec.onCalls);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)ctrl->scheduler().pendingCount());
}

void test_threshold_can_be_changed_at_runtime()
{
    build(5.0f, false, "10");
    ctrl->start(kT0);

    ControlMessage msg;
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->output()->state());

    ctrl->setThreshold(20.0f);
    TEST_ASSERT_EQUAL_FLOAT(20.0f, ctrl->threshold());
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + 2 * kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_FALSE(ctrl->output()->state());

    ctrl->setInverted(true);
    TEST_ASSERT_TRUE(ctrl->inverted());
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + 3 * kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->output()->state());
    TEST_ASSERT_TRUE(ctrl->interval() == kInterval);
}

void test_set_name_renames_messages()
{
    build(5.0f, false, "10");
    ctrl->setName("pool_heater");
    TEST_ASSERT_EQUAL_STRING("pool_heater", ctrl->name());
    ctrl->start(kT0);

    ControlMessage msg;
    TEST_ASSERT_TRUE(ctrl->poll(kT0 + kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_STRING("pool_heater", msg.controllerName());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_poll_before_start_is_not_ready_fault);
    RUN_TEST(test_start_arms_first_read_one_interval_later);
    RUN_TEST(test_above_threshold_activates_and_reports_sample);
    RUN_TEST(test_equal_value_is_below_non_inverted);
    RUN_TEST(test_equal_value_is_below_inverted_activates);
    RUN_TEST(test_inverted_above_deactivates);
    RUN_TEST(test_value_sequence_toggles_output);
    RUN_TEST(test_late_poll_reschedules_from_poll_time);
    RUN_TEST(test_same_instant_second_poll_is_idle);
    RUN_TEST(test_malformed_reading_is_recoverable);
    RUN_TEST(test_on_off_events_are_unexpected_and_not_rearmed);
    RUN_TEST(test_reading_parse_rules);
    RUN_TEST(test_input_failure_is_io_error_and_rearms);
    RUN_TEST(test_output_failure_is_io_error);
    RUN_TEST(test_threshold_can_be_changed_at_runtime);
    RUN_TEST(test_set_name_renames_messages);
    return UNITY_END();
}
