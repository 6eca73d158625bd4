#pragma once

#include <Arduino.h>

// -------------------------------------------------------------------------
// System Utilities Module
// -------------------------------------------------------------------------

class SystemUtils
{
private:
    static unsigned long rebootAt;
    static bool rebootPending;

public:
    // "2 days 3 hrs 4 mins 5 secs"; days are omitted when zero
    static String formatDuration(unsigned long ms);
    static String getUptime();
    static String getChipID();
    static String getResetReason();
    static uint32_t getFreeHeap();
    static uint32_t getTotalHeap();

    // Web page loading (SPIFFS)
    static String loadFile(const char *path);
    static String processTemplate(String tmpl);

    static bool isLowMemory();
    static void logBootSummary();

    /**
     * @brief Restart after delayMs, once the response has had time to go out
     *
     * Open PDU sessions are closed from loop() first so the PDU does not
     * keep a dead CLI login around until its own idle timeout.
     */
    static void requestReboot(const String &reason, unsigned long delayMs = 250);
    static void handlePendingReboot();
};
