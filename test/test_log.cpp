#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "BarrierConfig.h"
#include "Log.h"
#include "ParkingStateMachine.h"
#include "fakes/FakeBarrierActuator.h"
#include "fakes/FakeTimerService.h"

static std::vector<std::string> captured;

static void captureSink(const char* tag, const char* message) {
    captured.push_back(std::string("[") + tag + "] " + message);
}

static bool anyLineContains(const std::string& needle) {
    for (size_t i = 0; i < captured.size(); i++) {
        if (captured[i].find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        captured.clear();
        setLogSink(captureSink);
    }

    void TearDown() override {
        setLogSink(NULL);
    }
};

TEST_F(LogTest, FormatsTaggedLines) {
    logLine("INIT", "count=%d name=%s", 3, "gate");

    ASSERT_EQ(1u, captured.size());
    EXPECT_EQ("[INIT] count=3 name=gate", captured[0]);
}

TEST_F(LogTest, SilentWithoutSink) {
    setLogSink(NULL);
    logLine("INIT", "dropped");

    EXPECT_TRUE(captured.empty());
}

TEST_F(LogTest, LongLinesAreTruncated) {
    std::string longText(500, 'x');
    logLine("INIT", "%s", longText.c_str());

    ASSERT_EQ(1u, captured.size());
    EXPECT_LT(captured[0].size(), 250u);
}

TEST_F(LogTest, StateMachineLogsTransitionsAndRejections) {
    BarrierConfig config;
    getBarrierDefaults(config);
    FakeBarrierActuator actuator;
    FakeTimerService timers;
    ParkingStateMachine machine(actuator, timers, config);

    machine.notifyOutsideEdge();
    EXPECT_TRUE(anyLineContains("[BARRIER] state: barrier=OPEN count=0 pending=ENTRY_PENDING"));
    EXPECT_TRUE(anyLineContains("[TIMER] ENTRY timer armed for 3000 ms"));

    machine.requestForceClose(false, false);
    EXPECT_TRUE(anyLineContains("Manual close refused - sequence in progress"));

    actuator.failClose = true;
    timers.advance(3000);
    EXPECT_TRUE(anyLineContains("Actuator fault on CLOSE"));
}
