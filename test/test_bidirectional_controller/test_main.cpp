#include <unity.h>
#include <memory>

#include "Modules/Control/Controllers/BidirectionalThresholdController.h"
#include "Modules/Control/IO/CachedInput.h"
#include "Modules/Control/IO/CallbackOutput.h"

struct OutputRecorder {
    int onCalls = 0;
    int offCalls = 0;
};

static bool recordWrite(void* ctx, bool on)
{
    OutputRecorder* r = static_cast<OutputRecorder*>(ctx);
    if (on) ++r->onCalls; else ++r->offCalls;
    return true;
}

class InjectableBidirectionalController : public BidirectionalThresholdController {
public:
    using BidirectionalThresholdController::BidirectionalThresholdController;
    void injectOn(EpochMs t) { scheduler_.scheduleOn(t); }
};

static const int64_t kInterval = 1000;
static const EpochMs kT0 = 1609459200000LL;  // 2021-01-01T00:00:00Z

static OutputRecorder incRec;
static OutputRecorder decRec;
static CachedInput* input = nullptr;
static std::unique_ptr<BidirectionalThresholdController> ctrl;
static EpochMs now = 0;

static void build(float threshold, float tolerance)
{
    BidirectionalThresholdConfig cfg;
    cfg.name = "ph";
    cfg.threshold = threshold;
    cfg.tolerance = tolerance;
    cfg.intervalMs = kInterval;

    input = new CachedInput("ph_probe");
    ctrl.reset(new BidirectionalThresholdController(
        cfg,
        std::unique_ptr<ControlInput>(input),
        std::unique_ptr<ControlOutput>(new CallbackOutput("ph_plus", recordWrite, &incRec)),
        std::unique_ptr<ControlOutput>(new CallbackOutput("ph_minus", recordWrite, &decRec))));
    ctrl->start(kT0);
    now = kT0;
}

static PollStatus readValue(const char* value, ControlMessage& msg)
{
    input->update(value);
    now += kInterval;
    return ctrl->poll(now, msg);
}

void setUp()
{
    incRec = OutputRecorder{};
    decRec = OutputRecorder{};
    build(10.0f, 1.0f);
}

void tearDown()
{
    ctrl.reset();
}

void test_below_band_activates_increase()
{
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("8.0", msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->increaseOutput()->state());
    TEST_ASSERT_FALSE(ctrl->decreaseOutput()->state());
    TEST_ASSERT_TRUE(msg == ControlMessage("ph", "Below Threshold", now, "8.0"));
}

void test_inside_band_deactivates_both()
{
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("10.5", msg) == PollStatus::Fired);
    TEST_ASSERT_FALSE(ctrl->increaseOutput()->state());
    TEST_ASSERT_FALSE(ctrl->decreaseOutput()->state());
    TEST_ASSERT_TRUE(ctrl->increaseOutput()->hasState());
    TEST_ASSERT_EQUAL_STRING("Within Tolerance", msg.content());
}

void test_above_band_activates_decrease()
{
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("12.0", msg) == PollStatus::Fired);
    TEST_ASSERT_FALSE(ctrl->increaseOutput()->state());
    TEST_ASSERT_TRUE(ctrl->decreaseOutput()->state());
    TEST_ASSERT_EQUAL_STRING("Above Threshold", msg.content());
    TEST_ASSERT_EQUAL_STRING("12.0", msg.readState());
}

void test_band_edges_are_within_tolerance()
{
    TEST_ASSERT_TRUE(ctrl->classify(9.0f) == ToleranceZone::Within);
    TEST_ASSERT_TRUE(ctrl->classify(11.0f) == ToleranceZone::Within);
    TEST_ASSERT_TRUE(ctrl->classify(8.99f) == ToleranceZone::Below);
    TEST_ASSERT_TRUE(ctrl->classify(11.01f) == ToleranceZone::Above);
}

void test_same_zone_reissues_commands()
{
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("8.0", msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(readValue("7.0", msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_INT(2, incRec.onCalls);
    TEST_ASSERT_EQUAL_INT(2, decRec.offCalls);
}

void test_zone_changes_follow_each_reading()
{
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("12.0", msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->decreaseOutput()->state());

    TEST_ASSERT_TRUE(readValue("8.0", msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(ctrl->increaseOutput()->state());
    TEST_ASSERT_FALSE(ctrl->decreaseOutput()->state());

    TEST_ASSERT_TRUE(readValue("10.0", msg) == PollStatus::Fired);
    TEST_ASSERT_FALSE(ctrl->increaseOutput()->state());
    TEST_ASSERT_FALSE(ctrl->decreaseOutput()->state());
}

void test_malformed_reading_leaves_outputs_untouched()
{
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("12.0", msg) == PollStatus::Fired);
    const int decOnBefore = decRec.onCalls;

    TEST_ASSERT_TRUE(readValue("?", msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(ctrl->lastError() == ErrorCode::BadReading);
    TEST_ASSERT_TRUE(ctrl->decreaseOutput()->state());
    TEST_ASSERT_EQUAL_INT(decOnBefore, decRec.onCalls);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)ctrl->scheduler().pendingCount());

    TEST_ASSERT_TRUE(readValue("10.0", msg) == PollStatus::Fired);
    TEST_ASSERT_FALSE(ctrl->decreaseOutput()->state());
}

void test_each_read_rearms_next_interval()
{
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("10.0", msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)ctrl->scheduler().pendingCount());
    TEST_ASSERT_TRUE(ctrl->scheduler().pendingAt(0)->timestampMs() == now + kInterval);
    TEST_ASSERT_TRUE(ctrl->poll(now, msg) == PollStatus::Idle);
}

void test_zero_tolerance_has_single_point_band()
{
    build(7.2f, 0.0f);
    ControlMessage msg;
    TEST_ASSERT_TRUE(readValue("7.2", msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_STRING("Within Tolerance", msg.content());
    TEST_ASSERT_TRUE(readValue("7.3", msg) == PollStatus::Fired);
    TEST_ASSERT_EQUAL_STRING("Above Threshold", msg.content());
}

void test_on_event_is_unexpected_and_not_rearmed()
{
    BidirectionalThresholdConfig cfg;
    cfg.name = "ph";
    cfg.threshold = 7.2f;
    cfg.tolerance = 0.2f;
    cfg.intervalMs = kInterval;
    InjectableBidirectionalController c(
        cfg,
        std::unique_ptr<ControlInput>(new CachedInput("ph_probe", "5.0")),
        std::unique_ptr<ControlOutput>(new CallbackOutput("ph_plus", recordWrite, &incRec)),
        std::unique_ptr<ControlOutput>(new CallbackOutput("ph_minus", recordWrite, &decRec)));
    TEST_ASSERT_TRUE(c.start(kT0));
    c.injectOn(kT0 + 500);

    ControlMessage msg;
    TEST_ASSERT_TRUE(c.poll(kT0 + 500, msg) == PollStatus::Fault);
    TEST_ASSERT_TRUE(c.lastError() == ErrorCode::UnexpectedAction);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)c.scheduler().pendingCount());
    TEST_ASSERT_TRUE(c.scheduler().pendingAt(0)->timestampMs() == kT0 + kInterval);
    TEST_ASSERT_EQUAL_INT(0, incRec.onCalls + incRec.offCalls + decRec.onCalls + decRec.offCalls);

    // The regular read still runs afterwards.
    TEST_ASSERT_TRUE(c.poll(kT0 + kInterval, msg) == PollStatus::Fired);
    TEST_ASSERT_TRUE(c.increaseOutput()->state());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_below_band_activates_increase);
    RUN_TEST(test_inside_band_deactivates_both);
    RUN_TEST(test_above_band_activates_decrease);
    RUN_TEST(test_band_edges_are_within_tolerance);
    RUN_TEST(test_same_zone_reissues_commands);
    RUN_TEST(test_zone_changes_follow_each_reading);
    RUN_TEST(test_malformed_reading_leaves_outputs_untouched);
    RUN_TEST(test_each_read_rearms_next_interval);
    RUN_TEST(test_zero_tolerance_has_single_point_band);
    RUN_TEST(test_on_event_is_unexpected_and_not_rearmed);
    return UNITY_END();
}
