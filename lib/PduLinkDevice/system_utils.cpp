#include "system_utils.h"
#include "config.h"
#include "device_state.h"
#include "logger.h"
#include "session_manager.h"
#include <SPIFFS.h>
#include <WiFi.h>
#include <esp_system.h>

unsigned long SystemUtils::rebootAt = 0;
bool SystemUtils::rebootPending = false;

String SystemUtils::formatDuration(unsigned long ms)
{
    unsigned long secs = ms / 1000;
    unsigned long days = secs / 86400;
    secs %= 86400;
    unsigned long hours = secs / 3600;
    secs %= 3600;
    unsigned long mins = secs / 60;
    secs %= 60;

    char buf[50];
    if (days > 0)
    {
        snprintf(buf, sizeof(buf), "%lu days %lu hrs %lu mins %lu secs", days, hours, mins, secs);
    }
    else
    {
        snprintf(buf, sizeof(buf), "%lu hrs %lu mins %lu secs", hours, mins, secs);
    }
    return String(buf);
}

String SystemUtils::getUptime()
{
    return formatDuration(millis() - DeviceState::getBootTime());
}

String SystemUtils::getChipID()
{
    uint64_t chipid = ESP.getEfuseMac();
    return String((uint32_t)(chipid >> 32), HEX) + String((uint32_t)chipid, HEX);
}

String SystemUtils::getResetReason()
{
    switch (esp_reset_reason())
    {
    case ESP_RST_POWERON:
        return "Power On";
    case ESP_RST_SW:
        return "Software Restart";
    case ESP_RST_PANIC:
        return "Panic";
    case ESP_RST_INT_WDT:
    case ESP_RST_TASK_WDT:
    case ESP_RST_WDT:
        return "Watchdog";
    case ESP_RST_BROWNOUT:
        return "Brownout";
    case ESP_RST_DEEPSLEEP:
        return "Deep Sleep";
    default:
        return "Unknown";
    }
}

uint32_t SystemUtils::getFreeHeap()
{
    return ESP.getFreeHeap();
}

uint32_t SystemUtils::getTotalHeap()
{
    return ESP.getHeapSize();
}

String SystemUtils::loadFile(const char *path)
{
    if (!SPIFFS.exists(path))
    {
        LOG_WARNING("File not found on SPIFFS: " + std::string(path));
        return "";
    }

    File file = SPIFFS.open(path, "r");
    if (!file)
    {
        LOG_ERROR("Failed to open file: " + std::string(path));
        return "";
    }

    String content = file.readString();
    file.close();
    return content;
}

String SystemUtils::processTemplate(String tmpl)
{
    const auto &deviceConfig = DeviceState::getDeviceConfig();

    tmpl.replace("%PROJECT_NAME%", NAME);
    tmpl.replace("%VERSION%", VERSION);
    tmpl.replace("%DEVICE_NAME%", String(deviceConfig.deviceName));
    tmpl.replace("%DEVICE_ID%", String(deviceConfig.deviceId));
    tmpl.replace("%IP%", WiFi.localIP().toString());
    return tmpl;
}

bool SystemUtils::isLowMemory()
{
    return getFreeHeap() < CRITICAL_HEAP_THRESHOLD;
}

void SystemUtils::logBootSummary()
{
    const auto &deviceConfig = DeviceState::getDeviceConfig();

    LOG_INFO("=== Boot Summary ===");
    LOG_INFO("Reset reason: " + std::string(getResetReason().c_str()));
    LOG_INFO("Reboot count: " + std::to_string(deviceConfig.rebootCounter));
    LOG_INFO("Free Heap: " + std::to_string(getFreeHeap()) + " / " + std::to_string(getTotalHeap()) + " bytes");

    uint8_t configured = 0;
    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        if (!DeviceState::getEndpoint(slot).session.host.empty())
        {
            configured++;
        }
    }
    LOG_INFO("PDU endpoints configured: " + std::to_string(configured) + " of " + std::to_string(MAX_ENDPOINTS));
    LOG_INFO("====================");
}

void SystemUtils::requestReboot(const String &reason, unsigned long delayMs)
{
    LOG_INFO("Reboot requested: " + std::string(reason.c_str()));
    rebootAt = millis() + delayMs;
    rebootPending = true;
}

void SystemUtils::handlePendingReboot()
{
    if (!rebootPending || (long)(millis() - rebootAt) < 0)
    {
        return;
    }
    rebootPending = false;

    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        PduSession *session = SessionManager::getSession(slot);
        if (session && !session->connect(false))
        {
            LOG_WARNING("Session " + std::to_string(slot + 1) + " did not close cleanly before reboot");
        }
    }

    LOG_INFO("Restarting...");
    delay(100);
    ESP.restart();
}
