#include <gtest/gtest.h>
#include <vector>
#include "BarrierConfig.h"
#include "PresenceDetector.h"
#include "config.h"
#include "fakes/ScriptedDistanceSource.h"

static std::vector<uint32_t> recordedDelays;

static void recordDelay(uint32_t ms) {
    recordedDelays.push_back(ms);
}

class PresenceDetectorTest : public ::testing::Test {
protected:
    PresenceDetectorTest() : source(200.0f) {
        getBarrierDefaults(config);
        recordedDelays.clear();
    }

    BarrierConfig config;
    ScriptedDistanceSource source;
};

TEST_F(PresenceDetectorTest, QuorumOfNearReadingsMeansOccupied) {
    PresenceDetector detector(SensorSide::Outside, source, config, NULL);
    source.push({5.0f, 80.0f, 4.0f});

    EXPECT_TRUE(detector.sampleOccupancy());
}

TEST_F(PresenceDetectorTest, SingleSpikeIsRejected) {
    PresenceDetector detector(SensorSide::Outside, source, config, NULL);
    source.push({80.0f, 3.0f, 80.0f});

    EXPECT_FALSE(detector.sampleOccupancy());
}

TEST_F(PresenceDetectorTest, MissingEchoCountsAsFar) {
    PresenceDetector detector(SensorSide::Inside, source, config, NULL);
    source.push({NO_ECHO_DISTANCE_CM, 6.0f, NO_ECHO_DISTANCE_CM});

    EXPECT_FALSE(detector.sampleOccupancy());
}

TEST_F(PresenceDetectorTest, ThresholdIsExclusive) {
    PresenceDetector detector(SensorSide::Inside, source, config, NULL);
    source.push({10.0f, 10.0f, 10.0f});

    EXPECT_FALSE(detector.sampleOccupancy());

    source.push({9.9f, 9.9f, 10.0f});
    EXPECT_TRUE(detector.sampleOccupancy());
}

TEST_F(PresenceDetectorTest, TakesConfiguredBurstWithDelays) {
    PresenceDetector detector(SensorSide::Inside, source, config, recordDelay);

    detector.sampleOccupancy();

    EXPECT_EQ(3, source.measurementCount());
    ASSERT_EQ(3u, recordedDelays.size());
    for (size_t i = 0; i < recordedDelays.size(); i++) {
        EXPECT_EQ(50u, recordedDelays[i]);
    }
}

TEST_F(PresenceDetectorTest, CustomSampleCountAndQuorum) {
    config.debounceSampleCount = 5;
    config.debounceQuorum = 4;
    PresenceDetector detector(SensorSide::Outside, source, config, NULL);

    source.push({5.0f, 5.0f, 5.0f, 90.0f, 90.0f});
    EXPECT_FALSE(detector.sampleOccupancy());

    source.push({5.0f, 5.0f, 90.0f, 5.0f, 5.0f});
    EXPECT_TRUE(detector.sampleOccupancy());
    EXPECT_EQ(10, source.measurementCount());
}

TEST_F(PresenceDetectorTest, PollReportsOnlyRisingEdges) {
    PresenceDetector detector(SensorSide::Outside, source, config, NULL);

    source.push({90.0f, 90.0f, 90.0f});     // clear
    source.push({5.0f, 5.0f, 5.0f});        // arrives
    source.push({5.0f, 5.0f, 90.0f});       // still there
    source.push({90.0f, 90.0f, 90.0f});     // leaves
    source.push({5.0f, 5.0f, 5.0f});        // next vehicle

    EXPECT_FALSE(detector.poll());
    EXPECT_FALSE(detector.lastOccupancy());

    EXPECT_TRUE(detector.poll());
    EXPECT_TRUE(detector.lastOccupancy());

    EXPECT_FALSE(detector.poll());
    EXPECT_TRUE(detector.lastOccupancy());

    EXPECT_FALSE(detector.poll());
    EXPECT_FALSE(detector.lastOccupancy());

    EXPECT_TRUE(detector.poll());
}

TEST_F(PresenceDetectorTest, FreshSampleDoesNotDisturbEdgeTracking) {
    PresenceDetector detector(SensorSide::Inside, source, config, NULL);
    source.setFallback(5.0f);

    EXPECT_TRUE(detector.sampleOccupancy());
    EXPECT_FALSE(detector.lastOccupancy());

    // The polling loop still sees the first near reading as an edge
    EXPECT_TRUE(detector.poll());
}

TEST_F(PresenceDetectorTest, ReportsItsSide) {
    PresenceDetector inside(SensorSide::Inside, source, config, NULL);
    PresenceDetector outside(SensorSide::Outside, source, config, NULL);

    EXPECT_EQ(SensorSide::Inside, inside.getSide());
    EXPECT_EQ(SensorSide::Outside, outside.getSide());
}
