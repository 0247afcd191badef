#include "Relay.hpp"

#include <QCoreApplication>
#include <QDebug>

#include <algorithm>
#include <utility>

using namespace canvas;

CRelay::CRelay(const RelayConfig& config, ShutdownFn onShutdown) :
    m_config(config), m_onShutdown(std::move(onShutdown)), m_idleTimer(std::clamp(config.idleTimeout, std::chrono::seconds::zero(), MAX_IDLE_TIMEOUT)),
    m_router(
        m_registry, m_pending, [this](QWebSocket* socket, const QString& text) { m_server.sendText(socket, text); }, [this]() { m_idleTimer.touch(); }) {
    if (!m_onShutdown) {
        m_onShutdown = [] { QCoreApplication::exit(0); };
    }

    m_server.setMessageHandler([this](QWebSocket* socket, const QString& text) { m_router.route(socket, text); });

    QObject::connect(&m_server, &WsServer::clientDisconnected, &m_server, [this](QWebSocket* socket) { m_router.handleDisconnect(socket); });
    QObject::connect(&m_idleTimer, &relay::IdleTimer::expired, &m_server, [this]() { shutdown(); });
}

CRelay::~CRelay() {
    m_idleTimer.stop();
    m_server.stop();
}

bool CRelay::start(const QHostAddress& address) {
    if (!m_server.start(m_config.port, address))
        return false;

    m_idleTimer.start();
    return true;
}

void CRelay::shutdown() {
    const auto idleSeconds = std::chrono::duration_cast<std::chrono::seconds>(m_idleTimer.duration()).count();
    qInfo() << "No activity for" << idleSeconds << "seconds, shutting down";

    if (!m_pending.empty()) {
        qInfo() << "Abandoning" << m_pending.size() << "unanswered request(s)," << m_pending.orphanCount() << "orphaned";
    }

    m_idleTimer.stop();
    m_server.stop();
    m_registry.clearIf(m_registry.current());

    m_onShutdown();
}

quint16 CRelay::port() const {
    return m_server.serverPort();
}

bool CRelay::isListening() const {
    return m_server.isListening();
}

relay::BrowserRegistry& CRelay::registry() {
    return m_registry;
}

relay::PendingRequests& CRelay::pending() {
    return m_pending;
}

relay::IdleTimer& CRelay::idleTimer() {
    return m_idleTimer;
}
