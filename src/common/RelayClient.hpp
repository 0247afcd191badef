#pragma once

#include "Constants.hpp"

#include <QJsonObject>
#include <QString>
#include <QUrl>

#include <optional>

namespace canvas {

    // Short-lived client for talking to a running relay
    class RelayClient {
      public:
        explicit RelayClient(quint16 port);
        explicit RelayClient(const QUrl& url);

        // Send one envelope and wait for its reply. A request with an id waits
        // for the reply carrying the same id, anything else takes the first reply.
        // Returns std::nullopt on connection/timeout/parse failure
        std::optional<QJsonObject> sendRequest(const QJsonObject& request, int timeoutMs = RELAY_REQUEST_TIMEOUT_MS);

        // Quick ping to check if the relay is reachable
        bool ping();

        // std::nullopt when the relay itself is unreachable
        std::optional<bool> isBrowserConnected();

        // True when a WebSocket handshake completes, without sending anything
        bool           isRelayRunning();

        static QString generateId();
        static QUrl    urlForPort(quint16 port);

      private:
        QUrl m_url;
    };

} // namespace canvas
