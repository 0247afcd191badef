#include "WsServer.hpp"
#include "../../common/Constants.hpp"

#include <QDebug>
#include <QWebSocket>
#include <QWebSocketServer>

#include <utility>

namespace canvas {

    WsServer::WsServer(QObject* parent)
        : QObject(parent)
    {}

    WsServer::~WsServer() {
        stop();
    }

    bool WsServer::start(quint16 port, const QHostAddress& address) {
        if (m_server)
            return false;

        m_server = new QWebSocketServer(QStringLiteral("agent-canvas relay"), QWebSocketServer::NonSecureMode, this);
        m_server->setMaxAllowedIncomingMessageSize(static_cast<quint64>(MAX_MESSAGE_SIZE));

        if (!m_server->listen(address, port)) {
            qWarning() << "Failed to listen on port" << port << ":" << m_server->errorString();
            delete m_server;
            m_server = nullptr;
            return false;
        }

        connect(m_server, &QWebSocketServer::newConnection, this, &WsServer::onNewConnection);
        return true;
    }

    void WsServer::stop() {
        if (!m_server)
            return;

        // Refuse new connections before closing the existing ones
        m_server->close();

        const auto sockets = m_clients.values();
        for (auto* socket : sockets) {
            socket->close(QWebSocketProtocol::CloseCodeGoingAway);
        }

        delete m_server;
        m_server = nullptr;
    }

    bool WsServer::isListening() const {
        return m_server && m_server->isListening();
    }

    quint16 WsServer::serverPort() const {
        return m_server ? m_server->serverPort() : 0;
    }

    void WsServer::setMessageHandler(MessageHandler handler) {
        m_handler = std::move(handler);
    }

    void WsServer::sendText(QWebSocket* socket, const QString& text) {
        if (!socket || socket->state() != QAbstractSocket::ConnectedState)
            return;

        socket->sendTextMessage(text);
    }

    void WsServer::onNewConnection() {
        while (m_server->hasPendingConnections()) {
            QWebSocket* socket = m_server->nextPendingConnection();
            if (!socket)
                continue;

            socket->setParent(this);
            m_clients.insert(socket);

            connect(socket, &QWebSocket::textMessageReceived, this, &WsServer::onTextMessageReceived);
            connect(socket, &QWebSocket::binaryMessageReceived, this, &WsServer::onBinaryMessageReceived);
            connect(socket, &QWebSocket::disconnected, this, &WsServer::onDisconnected);
        }
    }

    void WsServer::onTextMessageReceived(const QString& message) {
        auto* socket = qobject_cast<QWebSocket*>(sender());
        if (!socket || !m_handler)
            return;

        m_handler(socket, message);
    }

    void WsServer::onBinaryMessageReceived(const QByteArray& message) {
        qDebug() << "Dropping binary frame of" << message.size() << "bytes";
    }

    void WsServer::onDisconnected() {
        auto* socket = qobject_cast<QWebSocket*>(sender());
        if (!socket)
            return;

        if (!m_clients.remove(socket))
            return;

        emit clientDisconnected(socket);

        socket->deleteLater();
    }

} // namespace canvas
