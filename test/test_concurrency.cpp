#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "BarrierConfig.h"
#include "ControlGateway.h"
#include "ParkingStateMachine.h"
#include "fakes/FakeBarrierActuator.h"
#include "fakes/FakeTimerService.h"
#include "fakes/ScriptedDistanceSource.h"

static BarrierConfig defaultConfig() {
    BarrierConfig config;
    getBarrierDefaults(config);
    return config;
}

// Sensor tasks, timer callbacks and portal readers all race against each other.
// Afterwards no actuator call may have overlapped and every snapshot taken
// along the way must have been consistent.
TEST(ConcurrencyTest, EventsFromAllSourcesStaySerialized) {
    BarrierConfig config = defaultConfig();
    FakeBarrierActuator actuator;
    FakeTimerService timers;
    ParkingStateMachine machine(actuator, timers, config);

    std::atomic<bool> inconsistent(false);
    std::atomic<bool> done(false);
    const int iterations = 2000;

    std::thread outsideTask([&]() {
        for (int i = 0; i < iterations; i++) {
            machine.notifyOutsideEdge();
        }
    });
    std::thread insideTask([&]() {
        for (int i = 0; i < iterations; i++) {
            machine.notifyInsideEdge();
        }
    });
    std::thread timerTask([&]() {
        for (int i = 0; i < iterations; i++) {
            timers.advance(1000);
        }
    });
    std::thread portalTask([&]() {
        int i = 0;
        while (!done.load()) {
            if (i % 7 == 0) {
                machine.forceOpen();
            } else if (i % 11 == 0) {
                machine.requestForceClose(false, false);
            }
            i++;
        }
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 2; r++) {
        readers.push_back(std::thread([&]() {
            while (!done.load()) {
                BarrierSnapshot s = machine.getSnapshot();
                if (s.pending != PendingTransition::None && s.position != BarrierPosition::Open) {
                    inconsistent = true;
                }
            }
        }));
    }

    outsideTask.join();
    insideTask.join();
    timerTask.join();
    done = true;
    portalTask.join();
    for (size_t r = 0; r < readers.size(); r++) {
        readers[r].join();
    }

    EXPECT_FALSE(inconsistent.load());
    EXPECT_FALSE(actuator.overlapped.load());
    EXPECT_FALSE(machine.isTimerArmed(TimerSlot::Entry) && machine.isTimerArmed(TimerSlot::Exit));

    // Drain outstanding timeouts; the barrier must settle closed and idle
    timers.advance(config.manualAutoCloseTimeoutS * 1000u);
    timers.advance(config.pendingTransitionTimeoutS * 1000u);
    BarrierSnapshot s = machine.getSnapshot();
    EXPECT_EQ(PendingTransition::None, s.pending);
    EXPECT_EQ(BarrierPosition::Closed, s.position);
}

TEST(ConcurrencyTest, ManualCloseRacingSensorsNeverClosesMidSequence) {
    BarrierConfig config = defaultConfig();
    FakeBarrierActuator actuator;
    FakeTimerService timers;
    ScriptedDistanceSource insideSource(200.0f);
    ScriptedDistanceSource outsideSource(200.0f);
    PresenceDetector inside(SensorSide::Inside, insideSource, config, NULL);
    PresenceDetector outside(SensorSide::Outside, outsideSource, config, NULL);
    ParkingStateMachine machine(actuator, timers, config);
    ControlGateway gateway(machine, inside, outside);

    std::atomic<int> closedDuringSequence(0);
    const int iterations = 1000;

    std::thread sensors([&]() {
        for (int i = 0; i < iterations; i++) {
            machine.notifyOutsideEdge();
            machine.notifyInsideEdge();
        }
    });
    std::thread portal([&]() {
        for (int i = 0; i < iterations; i++) {
            if (gateway.requestClose() == ManualCloseResult::Closed) {
                // Accepted closes must leave the machine idle
                BarrierSnapshot s = gateway.status();
                if (s.pending != PendingTransition::None && s.position == BarrierPosition::Closed) {
                    closedDuringSequence++;
                }
            }
        }
    });

    sensors.join();
    portal.join();

    EXPECT_EQ(0, closedDuringSequence.load());
    EXPECT_FALSE(actuator.overlapped.load());
    EXPECT_EQ((uint32_t)iterations, machine.getSnapshot().vehicleCount);
}
