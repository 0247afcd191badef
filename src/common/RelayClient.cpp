#include "RelayClient.hpp"
#include "Envelope.hpp"

#include <QEventLoop>
#include <QTimer>
#include <QUuid>
#include <QWebSocket>

namespace canvas {

    RelayClient::RelayClient(quint16 port) : RelayClient(urlForPort(port)) {}

    RelayClient::RelayClient(const QUrl& url) : m_url(url) {}

    std::optional<QJsonObject> RelayClient::sendRequest(const QJsonObject& request, int timeoutMs) {
        QWebSocket                 socket;
        QEventLoop                 loop;
        QTimer                     timer;
        std::optional<QJsonObject> reply;

        const QJsonValue           expectedId = request.value("id");

        timer.setSingleShot(true);
        QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

        QObject::connect(&socket, &QWebSocket::stateChanged, &loop, [&loop](QAbstractSocket::SocketState state) {
            if (state == QAbstractSocket::UnconnectedState)
                loop.quit();
        });

        QObject::connect(&socket, &QWebSocket::connected, &loop, [&]() {
            timer.start(timeoutMs);
            socket.sendTextMessage(toText(request));
        });

        QObject::connect(&socket, &QWebSocket::textMessageReceived, &loop, [&](const QString& text) {
            const auto envelope = parseEnvelope(text);
            if (!envelope)
                return;

            if (isCorrelationId(expectedId) && envelope->id != expectedId)
                return;

            reply = envelope->body;
            loop.quit();
        });

        timer.start(RELAY_CONNECT_TIMEOUT_MS);
        socket.open(m_url);
        loop.exec();

        socket.close();
        return reply;
    }

    bool RelayClient::ping() {
        auto response = sendRequest(makePing(), RELAY_PROBE_TIMEOUT_MS);
        return response && response->value("type").toString() == TYPE_PONG;
    }

    std::optional<bool> RelayClient::isBrowserConnected() {
        auto response = sendRequest(QJsonObject{{"type", TYPE_IS_BROWSER_CONNECTED}}, RELAY_PROBE_TIMEOUT_MS);
        if (!response || response->value("type").toString() != TYPE_BROWSER_STATUS)
            return std::nullopt;

        return response->value("connected").toBool();
    }

    bool RelayClient::isRelayRunning() {
        QWebSocket socket;
        QEventLoop loop;
        bool       connected = false;

        QTimer::singleShot(RELAY_PROBE_TIMEOUT_MS, &loop, &QEventLoop::quit);
        QObject::connect(&socket, &QWebSocket::connected, &loop, [&]() {
            connected = true;
            loop.quit();
        });
        QObject::connect(&socket, &QWebSocket::stateChanged, &loop, [&loop](QAbstractSocket::SocketState state) {
            if (state == QAbstractSocket::UnconnectedState)
                loop.quit();
        });

        socket.open(m_url);
        loop.exec();

        socket.close();
        return connected;
    }

    QString RelayClient::generateId() {
        return QUuid::createUuid().toString(QUuid::Id128).left(12);
    }

    QUrl RelayClient::urlForPort(quint16 port) {
        return QUrl(QStringLiteral("ws://localhost:%1").arg(port));
    }

} // namespace canvas
