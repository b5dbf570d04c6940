#include <gtest/gtest.h>
#include <set>
#include "config.h"

// GPIO capabilities of the classic ESP32 (WROOM-32 module)
static bool gpioExists(int pin) {
    return (pin >= 0 && pin <= 19) || pin == 21 || pin == 22 || pin == 23 ||
           (pin >= 25 && pin <= 27) || (pin >= 32 && pin <= 39);
}

static bool isFlashPin(int pin) {
    return pin >= 6 && pin <= 11;
}

static bool isStrappingPin(int pin) {
    return pin == 0 || pin == 2 || pin == 5 || pin == 12 || pin == 15;
}

static bool isInputOnly(int pin) {
    return pin >= 34 && pin <= 39;
}

static void expectUsableInput(int pin) {
    EXPECT_TRUE(gpioExists(pin)) << "GPIO " << pin;
    EXPECT_FALSE(isFlashPin(pin)) << "GPIO " << pin;
    EXPECT_FALSE(isStrappingPin(pin)) << "GPIO " << pin;
}

static void expectUsableOutput(int pin) {
    expectUsableInput(pin);
    EXPECT_FALSE(isInputOnly(pin)) << "GPIO " << pin;
}

TEST(PinMapTest, SensorPinsExistOnTheBoard) {
    expectUsableOutput(PIN_SENSOR_IN_TRIG);
    expectUsableInput(PIN_SENSOR_IN_ECHO);
    expectUsableOutput(PIN_SENSOR_OUT_TRIG);
    expectUsableInput(PIN_SENSOR_OUT_ECHO);
}

TEST(PinMapTest, ServoAndLcdPinsAreOutputCapable) {
    expectUsableOutput(PIN_BARRIER_SERVO);
    expectUsableOutput(PIN_LCD_SDA);
    expectUsableOutput(PIN_LCD_SCL);
}

TEST(PinMapTest, NoPinIsShared) {
    const int pins[] = {
        PIN_SENSOR_IN_TRIG, PIN_SENSOR_IN_ECHO,
        PIN_SENSOR_OUT_TRIG, PIN_SENSOR_OUT_ECHO,
        PIN_BARRIER_SERVO, PIN_LCD_SDA, PIN_LCD_SCL
    };
    std::set<int> unique(pins, pins + sizeof(pins) / sizeof(pins[0]));
    EXPECT_EQ(sizeof(pins) / sizeof(pins[0]), unique.size());
}
