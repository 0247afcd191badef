#pragma once

#include <QPointer>
#include <QWebSocket>

#include <functional>

namespace canvas::relay {

    // Single slot holding the connection that declared itself as the browser.
    // Registration is last-writer-wins.
    class BrowserRegistry {
      public:
        using NowFn = std::function<qint64()>;

        BrowserRegistry();
        explicit BrowserRegistry(NowFn nowFn);

        // Returns the connection that was replaced, or nullptr
        QWebSocket* registerBrowser(QWebSocket* socket);

        // Clears the slot only when `socket` is the registered browser, so a late
        // close of a replaced browser cannot drop the newer registration
        bool        clearIf(QWebSocket* socket);

        QWebSocket* current() const;
        bool        isRegistered(QWebSocket* socket) const;

        // Registered and the transport is still open
        bool        isConnected() const;

        qint64      registeredAtMs() const;

      private:
        NowFn                m_nowFn;

        QPointer<QWebSocket> m_browser;
        qint64               m_registeredAtMs = 0;
    };

} // namespace canvas::relay
