#include "serve.hpp"
#include "../common/RelayClient.hpp"
#include "../core/Relay.hpp"

#include <print>

namespace modes {

    int runServe(QCoreApplication& app, const canvas::RelayConfig& config) {
        if (canvas::RelayClient(config.port).isRelayRunning()) {
            std::print("Relay already running on port {}\n", config.port);
            return 0;
        }

        std::print("Starting agent-canvas relay\n");

        CRelay relay(config);
        if (!relay.start()) {
            std::print(stderr, "Failed to listen on port {}\n", config.port);
            return 1;
        }

        std::print("WebSocket: ws://localhost:{}\n", relay.port());
        if (config.idleTimeout.count() > 0) {
            std::print("Idle shutdown after {}s without activity\n", config.idleTimeout.count());
        } else {
            std::print("Idle shutdown disabled\n");
        }

        return app.exec();
    }

} // namespace modes
