#include "BrowserRegistry.hpp"

#include <QDateTime>

#include <utility>

namespace canvas::relay {

    BrowserRegistry::BrowserRegistry() : BrowserRegistry([] { return QDateTime::currentMSecsSinceEpoch(); }) {}

    BrowserRegistry::BrowserRegistry(NowFn nowFn) : m_nowFn(std::move(nowFn)) {}

    QWebSocket* BrowserRegistry::registerBrowser(QWebSocket* socket) {
        QWebSocket* previous = m_browser;

        m_browser        = socket;
        m_registeredAtMs = m_nowFn();

        return (previous == socket) ? nullptr : previous;
    }

    bool BrowserRegistry::clearIf(QWebSocket* socket) {
        if (!socket || m_browser != socket) {
            return false;
        }

        m_browser        = nullptr;
        m_registeredAtMs = 0;
        return true;
    }

    QWebSocket* BrowserRegistry::current() const {
        return m_browser;
    }

    bool BrowserRegistry::isRegistered(QWebSocket* socket) const {
        return socket && m_browser == socket;
    }

    bool BrowserRegistry::isConnected() const {
        return m_browser && m_browser->state() == QAbstractSocket::ConnectedState;
    }

    qint64 BrowserRegistry::registeredAtMs() const {
        return m_browser ? m_registeredAtMs : 0;
    }

} // namespace canvas::relay
