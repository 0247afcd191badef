#pragma once

#include <QHostAddress>
#include <QObject>
#include <QSet>
#include <QString>

#include <functional>

class QWebSocket;
class QWebSocketServer;

namespace canvas {

    // Callback type for handling text frames
    // Parameters: socket, frame text
    using MessageHandler = std::function<void(QWebSocket*, const QString&)>;

    class WsServer : public QObject {
        Q_OBJECT

      public:
        explicit WsServer(QObject* parent = nullptr);
        ~WsServer() override;

        // Start listening on the given port (0 picks a free one)
        // Returns false if binding fails
        bool start(quint16 port, const QHostAddress& address = QHostAddress::Any);

        // Stop accepting connections and close all clients
        void stop();

        bool isListening() const;
        quint16 serverPort() const;

        // Set the handler for incoming text frames
        void setMessageHandler(MessageHandler handler);

        // Queue a text frame on a specific socket; closed sockets are skipped
        void sendText(QWebSocket* socket, const QString& text);

      signals:
        void clientDisconnected(QWebSocket* socket);

      private slots:
        void onNewConnection();
        void onTextMessageReceived(const QString& message);
        void onBinaryMessageReceived(const QByteArray& message);
        void onDisconnected();

      private:
        QWebSocketServer* m_server = nullptr;
        MessageHandler m_handler;
        QSet<QWebSocket*> m_clients;
    };

} // namespace canvas
