#include "Config.hpp"

#include <QDebug>
#include <QProcessEnvironment>

#include <algorithm>

namespace canvas {

    std::optional<quint16> parsePort(const QString& value) {
        bool       ok   = false;
        const uint port = value.trimmed().toUInt(&ok);
        if (!ok || port < 1 || port > 65535)
            return std::nullopt;

        return static_cast<quint16>(port);
    }

    std::optional<std::chrono::seconds> parseIdleTimeout(const QString& value) {
        bool         ok      = false;
        const qint64 seconds = value.trimmed().toLongLong(&ok);
        if (!ok || seconds < 0)
            return std::nullopt;

        return std::min(std::chrono::seconds(seconds), MAX_IDLE_TIMEOUT);
    }

    RelayConfig loadConfig() {
        return loadConfig(QProcessEnvironment::systemEnvironment());
    }

    RelayConfig loadConfig(const QProcessEnvironment& env) {
        RelayConfig config;

        if (env.contains(ENV_WS_PORT)) {
            const QString value = env.value(ENV_WS_PORT);
            if (const auto port = parsePort(value)) {
                config.port = *port;
            } else {
                qWarning() << "Ignoring invalid" << ENV_WS_PORT << value << "- port must be an integer between 1 and 65535";
            }
        }

        if (env.contains(ENV_IDLE_TIMEOUT)) {
            const QString value = env.value(ENV_IDLE_TIMEOUT);
            if (const auto timeout = parseIdleTimeout(value)) {
                config.idleTimeout = *timeout;
            } else {
                qWarning() << "Ignoring invalid" << ENV_IDLE_TIMEOUT << value << "- expected a non-negative number of seconds";
            }
        }

        return config;
    }

} // namespace canvas
