#include "LCDDisplay.h"
#include <Wire.h>

LCDDisplay::LCDDisplay(uint8_t addr, uint8_t cols, uint8_t rows)
    : lcd(addr, cols, rows), cols(cols), rows(rows) {
}

void LCDDisplay::begin(uint8_t sda, uint8_t scl) {
    Wire.begin(sda, scl);
    lcd.init();
    lcd.backlight();
    lcd.clear();
    cachedLine1 = "";
    cachedLine2 = "";
}

void LCDDisplay::show(const String& line1, const String& line2) {
    String l1 = fit(line1, cols);
    String l2 = fit(line2, cols);

    // Only update if changed (prevent flickering)
    if (l1 == cachedLine1 && l2 == cachedLine2) {
        return;
    }

    cachedLine1 = l1;
    cachedLine2 = l2;

    lcd.setCursor(0, 0);
    lcd.print(cachedLine1);
    lcd.setCursor(0, 1);
    lcd.print(cachedLine2);
}

void LCDDisplay::showStatus(const BarrierSnapshot& snapshot) {
    String line1 = "Gate: ";
    line1 += barrierPositionName(snapshot.position);
    if (snapshot.actuatorFault) {
        line1 += " FAULT";
    } else if (snapshot.pending == PendingTransition::EntryPending) {
        line1 += " IN";
    } else if (snapshot.pending == PendingTransition::ExitPending) {
        line1 += " OUT";
    }

    String line2 = "Cars: " + String(snapshot.vehicleCount);
    show(line1, line2);
}

String LCDDisplay::fit(const String& s, uint8_t maxLen) {
    if (s.length() >= maxLen) {
        return s.substring(0, maxLen);
    }
    String result = s;
    while (result.length() < maxLen) {
        result += ' ';
    }
    return result;
}
