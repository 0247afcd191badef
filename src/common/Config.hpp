#pragma once

#include "Constants.hpp"

#include <QString>

#include <chrono>
#include <optional>

class QProcessEnvironment;

namespace canvas {

    struct RelayConfig {
        quint16              port        = DEFAULT_WS_PORT;
        std::chrono::seconds idleTimeout = DEFAULT_IDLE_TIMEOUT; // 0 disables idle shutdown
    };

    // Accepts integers in 1..65535
    std::optional<quint16> parsePort(const QString& value);

    // Accepts a non-negative number of seconds. Values above MAX_IDLE_TIMEOUT are clamped to it.
    std::optional<std::chrono::seconds> parseIdleTimeout(const QString& value);

    // Built-in defaults overridden by AGENT_CANVAS_WS_PORT and AGENT_CANVAS_IDLE_TIMEOUT.
    // Invalid values are logged and ignored.
    RelayConfig loadConfig();
    RelayConfig loadConfig(const QProcessEnvironment& env);

} // namespace canvas
