#include "MessageRouter.hpp"
#include "../../common/Constants.hpp"

#include <QDebug>
#include <QWebSocket>

#include <utility>

namespace canvas::relay {

    namespace {

        bool isOpen(QWebSocket* socket) {
            return socket && socket->state() == QAbstractSocket::ConnectedState;
        }

    } // namespace

    MessageRouter::MessageRouter(BrowserRegistry& registry, PendingRequests& pending, SendFn sendFn, TouchFn touchFn) :
        m_registry(registry), m_pending(pending), m_sendFn(std::move(sendFn)), m_touchFn(std::move(touchFn)) {
        registerHandler(TYPE_BROWSER_CONNECT, [this](QWebSocket* socket, const Envelope& envelope) { onBrowserConnect(socket, envelope); });
        registerHandler(TYPE_PING, [this](QWebSocket* socket, const Envelope& envelope) { onPing(socket, envelope); });
        registerHandler(TYPE_IS_BROWSER_CONNECTED, [this](QWebSocket* socket, const Envelope& envelope) { onIsBrowserConnected(socket, envelope); });
    }

    void MessageRouter::route(QWebSocket* socket, const QString& text) {
        const auto envelope = parseEnvelope(text);
        if (!envelope) {
            qDebug() << "Dropping frame that is not a JSON object";
            return;
        }

        route(socket, *envelope);
    }

    void MessageRouter::route(QWebSocket* socket, const Envelope& envelope) {
        if (dispatch(socket, envelope)) {
            return;
        }

        // Answers from the browser to a forwarded command
        if (envelope.hasId() && forwardResponse(envelope)) {
            return;
        }

        if (!envelope.hasType() || !envelope.hasId()) {
            qDebug() << "Dropping envelope without type or id:" << envelope.type << envelope.id;
            return;
        }

        forwardCommand(socket, envelope);
    }

    void MessageRouter::handleDisconnect(QWebSocket* socket) {
        if (m_registry.clearIf(socket)) {
            qInfo() << "Browser disconnected";
        }

        // Entries this connection was waiting on are left in place; a late answer is dropped in forwardResponse
        const std::size_t abandoned = m_pending.countForRequester(socket);
        if (abandoned > 0) {
            qDebug() << "Requester disconnected with" << abandoned << "request(s) in flight";
        }
    }

    void MessageRouter::registerHandler(const QString& type, HandlerFn handler) {
        m_handlers.insert(type, std::move(handler));
    }

    bool MessageRouter::dispatch(QWebSocket* socket, const Envelope& envelope) const {
        if (!envelope.hasType()) {
            return false;
        }

        auto it = m_handlers.constFind(envelope.type);
        if (it == m_handlers.constEnd()) {
            return false;
        }

        it.value()(socket, envelope);
        return true;
    }

    void MessageRouter::onBrowserConnect(QWebSocket* socket, const Envelope&) {
        touch();

        if (m_registry.registerBrowser(socket)) {
            qInfo() << "Browser connected, replacing the previous browser connection";
        } else {
            qInfo() << "Browser connected";
        }
    }

    void MessageRouter::onPing(QWebSocket* socket, const Envelope&) {
        send(socket, toText(makePong()));
    }

    void MessageRouter::onIsBrowserConnected(QWebSocket* socket, const Envelope&) {
        send(socket, toText(makeBrowserStatus(m_registry.isConnected())));
    }

    bool MessageRouter::forwardResponse(const Envelope& envelope) {
        auto request = m_pending.take(envelope.id);
        if (!request) {
            return false;
        }

        touch();

        if (!isOpen(request->requester)) {
            qDebug() << "Dropping answer to" << request->id << "- requester is gone";
            return true;
        }

        send(request->requester, envelope.raw);
        return true;
    }

    void MessageRouter::forwardCommand(QWebSocket* socket, const Envelope& envelope) {
        QWebSocket* browser = m_registry.current();

        touch();

        if (!m_registry.isConnected()) {
            send(socket, toText(makeFailure(envelope.id, BROWSER_NOT_CONNECTED_ERROR)));
            return;
        }

        // Cannot collide: an id that is already pending was consumed by forwardResponse
        if (!m_pending.insert(envelope.id, socket, envelope.type)) {
            qDebug() << "Dropping command with duplicate id" << envelope.id;
            return;
        }

        send(browser, envelope.raw);
    }

    void MessageRouter::send(QWebSocket* socket, const QString& text) const {
        if (m_sendFn) {
            m_sendFn(socket, text);
        }
    }

    void MessageRouter::touch() const {
        if (m_touchFn) {
            m_touchFn();
        }
    }

} // namespace canvas::relay
