#pragma once

#include <QtGlobal>

#include <chrono>
#include <cstddef>
#include <limits>

namespace canvas {

    // Relay configuration
    inline constexpr quint16              DEFAULT_WS_PORT      = 7890;
    inline constexpr std::chrono::seconds DEFAULT_IDLE_TIMEOUT = std::chrono::hours(2);
    // Longest interval a QTimer can hold (INT_MAX ms, about 24.8 days)
    inline constexpr std::chrono::seconds MAX_IDLE_TIMEOUT = std::chrono::seconds(std::numeric_limits<int>::max() / 1000);

    inline constexpr const char*          ENV_WS_PORT      = "AGENT_CANVAS_WS_PORT";
    inline constexpr const char*          ENV_IDLE_TIMEOUT = "AGENT_CANVAS_IDLE_TIMEOUT";

    // Exported scenes with embedded images can be large
    inline constexpr std::size_t MAX_MESSAGE_SIZE = 100 * 1024 * 1024; // 100 MiB

    // Client timeouts
    inline constexpr int RELAY_CONNECT_TIMEOUT_MS = 1000;
    inline constexpr int RELAY_PROBE_TIMEOUT_MS   = 1000;
    inline constexpr int RELAY_REQUEST_TIMEOUT_MS = 30 * 1000;

    inline constexpr const char* BROWSER_NOT_CONNECTED_ERROR = "Browser not connected. Please open the canvas in your browser.";

} // namespace canvas
