#include <gtest/gtest.h>
#include <cmath>
#include "BarrierConfig.h"

class BarrierConfigTest : public ::testing::Test {
protected:
    BarrierConfigTest() {
        getBarrierDefaults(config);
    }

    BarrierConfig config;
};

TEST_F(BarrierConfigTest, DefaultsMatchDocumentedValues) {
    EXPECT_FLOAT_EQ(10.0f, config.distanceThresholdCm);
    EXPECT_EQ(3, config.debounceSampleCount);
    EXPECT_EQ(2, config.debounceQuorum);
    EXPECT_EQ(50, config.interSampleDelayMs);
    EXPECT_EQ(50, config.sensorPollIntervalMs);
    EXPECT_EQ(3, config.pendingTransitionTimeoutS);
    EXPECT_EQ(5, config.manualAutoCloseTimeoutS);
    EXPECT_EQ(20, config.echoTimeoutMs);

    EXPECT_TRUE(validateBarrierConfig(config));
}

TEST_F(BarrierConfigTest, RejectsNonPositiveThreshold) {
    config.distanceThresholdCm = 0.0f;
    EXPECT_FALSE(validateBarrierConfig(config));

    config.distanceThresholdCm = NAN;
    EXPECT_FALSE(validateBarrierConfig(config));
}

TEST_F(BarrierConfigTest, QuorumMustFitSampleCount) {
    config.debounceSampleCount = 3;
    config.debounceQuorum = 4;
    EXPECT_FALSE(validateBarrierConfig(config));

    config.debounceQuorum = 3;
    EXPECT_TRUE(validateBarrierConfig(config));

    config.debounceQuorum = 0;
    EXPECT_FALSE(validateBarrierConfig(config));
}

TEST_F(BarrierConfigTest, SampleCountBounds) {
    config.debounceSampleCount = 0;
    config.debounceQuorum = 0;
    EXPECT_FALSE(validateBarrierConfig(config));

    config.debounceSampleCount = 11;
    config.debounceQuorum = 6;
    EXPECT_FALSE(validateBarrierConfig(config));

    config.debounceSampleCount = 1;
    config.debounceQuorum = 1;
    EXPECT_TRUE(validateBarrierConfig(config));
}

TEST_F(BarrierConfigTest, ZeroInterSampleDelayIsAllowed) {
    config.interSampleDelayMs = 0;
    EXPECT_TRUE(validateBarrierConfig(config));

    config.interSampleDelayMs = 1001;
    EXPECT_FALSE(validateBarrierConfig(config));
}

TEST_F(BarrierConfigTest, TimeoutsMustBePositive) {
    BarrierConfig broken = config;
    broken.pendingTransitionTimeoutS = 0;
    EXPECT_FALSE(validateBarrierConfig(broken));

    broken = config;
    broken.manualAutoCloseTimeoutS = 0;
    EXPECT_FALSE(validateBarrierConfig(broken));

    broken = config;
    broken.sensorPollIntervalMs = 0;
    EXPECT_FALSE(validateBarrierConfig(broken));

    broken = config;
    broken.echoTimeoutMs = 0;
    EXPECT_FALSE(validateBarrierConfig(broken));
}

TEST_F(BarrierConfigTest, UpperBounds) {
    BarrierConfig broken = config;
    broken.pendingTransitionTimeoutS = 61;
    EXPECT_FALSE(validateBarrierConfig(broken));

    broken = config;
    broken.manualAutoCloseTimeoutS = 601;
    EXPECT_FALSE(validateBarrierConfig(broken));

    broken = config;
    broken.echoTimeoutMs = 101;
    EXPECT_FALSE(validateBarrierConfig(broken));
}

TEST_F(BarrierConfigTest, SettingStoresValuesThatFit) {
    EXPECT_TRUE(setBarrierSetting(config, "samples", 5));
    EXPECT_TRUE(setBarrierSetting(config, "quorum", 4));
    EXPECT_TRUE(setBarrierSetting(config, "pending_s", 10));
    EXPECT_TRUE(setBarrierSetting(config, "sample_ms", 0));

    EXPECT_EQ(5, config.debounceSampleCount);
    EXPECT_EQ(4, config.debounceQuorum);
    EXPECT_EQ(10, config.pendingTransitionTimeoutS);
    EXPECT_EQ(0, config.interSampleDelayMs);
    EXPECT_TRUE(validateBarrierConfig(config));
}

TEST_F(BarrierConfigTest, SettingRejectsValuesThatWouldWrap) {
    // 259 and 65539 would truncate to the valid defaults 3 and 3
    EXPECT_FALSE(setBarrierSetting(config, "samples", 259));
    EXPECT_FALSE(setBarrierSetting(config, "quorum", 258));
    EXPECT_FALSE(setBarrierSetting(config, "pending_s", 65539L));
    EXPECT_FALSE(setBarrierSetting(config, "manual_s", 70000L));

    BarrierConfig defaults;
    getBarrierDefaults(defaults);
    EXPECT_EQ(defaults.debounceSampleCount, config.debounceSampleCount);
    EXPECT_EQ(defaults.debounceQuorum, config.debounceQuorum);
    EXPECT_EQ(defaults.pendingTransitionTimeoutS, config.pendingTransitionTimeoutS);
    EXPECT_EQ(defaults.manualAutoCloseTimeoutS, config.manualAutoCloseTimeoutS);
}

TEST_F(BarrierConfigTest, SettingRejectsNegativeValues) {
    EXPECT_FALSE(setBarrierSetting(config, "poll_ms", -1));
    EXPECT_FALSE(setBarrierSetting(config, "echo_ms", -65516L));
    EXPECT_FALSE(setBarrierSetting(config, "samples", -253));

    EXPECT_EQ(50, config.sensorPollIntervalMs);
    EXPECT_EQ(20, config.echoTimeoutMs);
    EXPECT_EQ(3, config.debounceSampleCount);
}

TEST_F(BarrierConfigTest, SettingInRangeOfTypeStillFailsValidation) {
    ASSERT_TRUE(setBarrierSetting(config, "pending_s", 61));
    EXPECT_FALSE(validateBarrierConfig(config));
}

TEST_F(BarrierConfigTest, UnknownSettingIsRejected) {
    EXPECT_FALSE(setBarrierSetting(config, "dist_cm", 5));
    EXPECT_FALSE(setBarrierSetting(config, "bogus", 1));
}
