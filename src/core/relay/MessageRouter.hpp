#pragma once

#include "../../common/Envelope.hpp"
#include "BrowserRegistry.hpp"
#include "PendingRequests.hpp"

#include <QHash>
#include <QString>

#include <functional>

class QWebSocket;

namespace canvas::relay {

    // Classifies every inbound envelope and moves it to its destination.
    // Sole owner of routing decisions over the registry and the pending table.
    class MessageRouter {
      public:
        using HandlerFn = std::function<void(QWebSocket*, const Envelope&)>;
        using SendFn    = std::function<void(QWebSocket*, const QString&)>;
        using TouchFn   = std::function<void()>;

        MessageRouter(BrowserRegistry& registry, PendingRequests& pending, SendFn sendFn, TouchFn touchFn = {});

        // Entry point for raw text frames. Frames that are not JSON objects are dropped.
        void route(QWebSocket* socket, const QString& text);
        void route(QWebSocket* socket, const Envelope& envelope);

        void handleDisconnect(QWebSocket* socket);

        void registerHandler(const QString& type, HandlerFn handler);
        bool dispatch(QWebSocket* socket, const Envelope& envelope) const;

      private:
        void             onBrowserConnect(QWebSocket* socket, const Envelope& envelope);
        void             onPing(QWebSocket* socket, const Envelope& envelope);
        void             onIsBrowserConnected(QWebSocket* socket, const Envelope& envelope);

        bool             forwardResponse(const Envelope& envelope);
        void             forwardCommand(QWebSocket* socket, const Envelope& envelope);

        void             send(QWebSocket* socket, const QString& text) const;
        void             touch() const;

        BrowserRegistry& m_registry;
        PendingRequests& m_pending;
        SendFn           m_sendFn;
        TouchFn          m_touchFn;

        QHash<QString, HandlerFn> m_handlers;
    };

} // namespace canvas::relay
