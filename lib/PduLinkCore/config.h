#pragma once

#include <stdint.h>
#include <stddef.h>

// -------------------------------------------------------------------------
// Project Configuration
// -------------------------------------------------------------------------
#define NAME "PduLink"
#define VERSION "1.0.0"
#define AUTHOR "Half Baked Circuits"
#define MDNS_NAME "PduLink"

// PDU CLI Defaults
#define DEFAULT_PDU_PORT 23
#define DEFAULT_PDU_PROMPT "[My PDU] #"

// Protocol markers
#define MARKER_USERNAME "Username:"
#define MARKER_PASSWORD "Password:"
#define MARKER_WELCOME "Welcome"
#define MARKER_AUTH_FAILED "Authentication failed"
#define MARKER_CONFIRM "Do you wish to"
#define LINE_TERMINATOR "\r\n"

// Outlet / Group Limits
static constexpr uint8_t MAX_OUTLETS = 24;
static constexpr uint8_t MAX_GROUPS = 10;
static constexpr const char *UNUSED_GROUP_LABEL = "Unused Group";

// Buffer Limits
static constexpr size_t RESPONSE_BUFFER_SIZE = 8192;

// Timing Constants
static constexpr uint32_t RESPONSE_TIMEOUT_MS = 10000;         // command / confirmation timeout
static constexpr uint32_t CONFIRMATION_SAFETY_MS = 30000;      // absolute cap on an armed command
static constexpr uint32_t PROCESSING_SAFETY_MS = 30000;        // processing indicator watchdog after confirm
static constexpr uint32_t POLL_INTERVAL_MS = 30000;
static constexpr uint32_t FIRST_POLL_DELAY_MS = 5000;          // grace after the welcome banner
static constexpr uint32_t USERNAME_SEND_DELAY_MS = 500;
static constexpr uint32_t PASSWORD_SEND_DELAY_MS = 1000;
static constexpr uint32_t POST_GROUP_COOLDOWN_MS = 30000;
static constexpr uint32_t REVERT_GUARD_MS = 10000;
static constexpr uint32_t STUCK_PROCESSING_CHECK_MS = 60000;
static constexpr uint32_t HEALTH_REPORT_INTERVAL_MS = 300000;
static constexpr uint32_t AUTO_CONNECT_DELAY_MS = 100;

// Poller
static constexpr uint8_t MAX_POLL_SKIPS = 5;

// Command Retry Policy
static constexpr uint8_t COMMAND_RETRY_ATTEMPTS = 3;
static constexpr uint32_t COMMAND_RETRY_DELAY_MS = 1000;
static constexpr uint32_t COMMAND_RETRY_BUDGET_MS = 30000;

// Reconnection Policy
static constexpr uint8_t MAX_RECONNECT_ATTEMPTS = 5;
static constexpr uint32_t RECONNECT_BASE_DELAY_MS = 2000;
static constexpr uint32_t RECONNECT_MAX_DELAY_MS = 60000;
static constexpr uint32_t RECONNECT_JITTER_MS = 2000;

// Broadcast Coordination
static constexpr uint32_t BROADCAST_COOLDOWN_MS = 1000;
static constexpr uint32_t BROADCAST_SETTLE_MS = 3000;
static constexpr uint32_t BROADCAST_CHECK_INTERVAL_MS = 500;
static constexpr uint32_t BROADCAST_NO_MATCH_RELEASE_MS = 500;
static constexpr uint32_t BROADCAST_DEFER_LIMIT_MS = 40000; // receiver gives up waiting for local user work

// Scheduler
static constexpr size_t MAX_ACTIVE_TIMERS = 50;

// Health
static constexpr uint32_t HIGH_ERROR_THRESHOLD = 10;

// Device Network Configuration
#define HTTP_PORT 80
#define BROADCAST_UDP_PORT 4211
#define BROADCAST_UDP_TAG "PduLink"
#define WIFI_AP_NAME "PduLink Setup"

// Device Configuration
#define MIN_DEVICE_ID 1
#define MAX_DEVICE_ID 99
#define DEFAULT_DEVICE_ID 1
#define DEFAULT_DEVICE_NAME "PduLink Controller"
static constexpr uint8_t MAX_ENDPOINTS = 4;
static constexpr size_t MAX_DEVICE_NAME_LENGTH = 64;
static constexpr size_t TRANSPORT_EVENT_QUEUE_SIZE = 32;
static constexpr uint32_t CRITICAL_HEAP_THRESHOLD = 30000;
static constexpr uint32_t CONFIG_PORTAL_TIMEOUT_S = 180;
