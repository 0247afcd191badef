#pragma once

#include "../common/Config.hpp"
#include "relay/BrowserRegistry.hpp"
#include "relay/IdleTimer.hpp"
#include "relay/MessageRouter.hpp"
#include "relay/PendingRequests.hpp"
#include "ws/WsServer.hpp"

#include <QHostAddress>

#include <functional>

// Owns the WebSocket listener and the routing state. Everything runs on the
// thread of the Qt event loop, so the router is the only writer of the
// registry and the pending table.
class CRelay {
  public:
    using ShutdownFn = std::function<void()>;

    // `onShutdown` runs after an idle shutdown closed every connection.
    // By default it ends the event loop with exit code 0.
    explicit CRelay(const canvas::RelayConfig& config, ShutdownFn onShutdown = {});
    ~CRelay();

    bool                              start(const QHostAddress& address = QHostAddress::Any);
    void                              shutdown();

    quint16                           port() const;
    bool                              isListening() const;

    canvas::relay::BrowserRegistry&   registry();
    canvas::relay::PendingRequests&   pending();
    canvas::relay::IdleTimer&         idleTimer();

  private:
    canvas::RelayConfig               m_config;
    ShutdownFn                        m_onShutdown;

    canvas::WsServer                  m_server;
    canvas::relay::BrowserRegistry    m_registry;
    canvas::relay::PendingRequests    m_pending;
    canvas::relay::IdleTimer          m_idleTimer;
    canvas::relay::MessageRouter      m_router;
};
