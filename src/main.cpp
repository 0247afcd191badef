#include "common/Config.hpp"
#include "modes/client.hpp"
#include "modes/serve.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>

#include <print>

namespace {

    int runCli(QCoreApplication& app) {
        QCommandLineParser parser;
        parser.setApplicationDescription("Agent Canvas relay - bridges CLI commands to the canvas in the browser");
        parser.addHelpOption();
        parser.addVersionOption();

        // Mode options
        QCommandLineOption optServe(QStringList{"serve"}, "Run the relay (default).");

        // Relay settings
        QCommandLineOption optPort(QStringList{"port", "p"}, "WebSocket port (overrides AGENT_CANVAS_WS_PORT).", "port");
        QCommandLineOption optIdle(QStringList{"idle-timeout"}, "Seconds without activity before shutdown, 0 disables (overrides AGENT_CANVAS_IDLE_TIMEOUT).",
                                   "seconds");

        // CLI options (for interacting with a running relay)
        QCommandLineOption optPing(QStringList{"ping"}, "Check if the relay is reachable.");
        QCommandLineOption optStatus(QStringList{"status"}, "Report whether a browser is connected to the relay.");
        QCommandLineOption optSend(QStringList{"send"}, "Send a canvas command of the given type.", "type");
        QCommandLineOption optParams(QStringList{"params"}, "JSON object sent as the command params.", "json");
        QCommandLineOption optTimeout(QStringList{"timeout"}, "Milliseconds to wait for the reply to --send.", "ms",
                                      QString::number(canvas::RELAY_REQUEST_TIMEOUT_MS));

        parser.addOption(optServe);
        parser.addOption(optPort);
        parser.addOption(optIdle);
        parser.addOption(optPing);
        parser.addOption(optStatus);
        parser.addOption(optSend);
        parser.addOption(optParams);
        parser.addOption(optTimeout);

        parser.process(app);

        canvas::RelayConfig config = canvas::loadConfig();

        if (parser.isSet(optPort)) {
            const auto port = canvas::parsePort(parser.value(optPort));
            if (!port) {
                std::print(stderr, "Port must be an integer between 1 and 65535\n");
                return 1;
            }
            config.port = *port;
        }

        if (parser.isSet(optIdle)) {
            const auto timeout = canvas::parseIdleTimeout(parser.value(optIdle));
            if (!timeout) {
                std::print(stderr, "Idle timeout must be a non-negative number of seconds\n");
                return 1;
            }
            config.idleTimeout = *timeout;
        }

        // Check for explicit mode switch
        if (parser.isSet(optServe)) {
            return modes::runServe(app, config);
        }

        if (parser.isSet(optPing)) {
            return modes::runPing(config.port);
        }

        if (parser.isSet(optStatus)) {
            return modes::runStatus(config.port);
        }

        if (parser.isSet(optSend)) {
            bool      ok        = false;
            const int timeoutMs = parser.value(optTimeout).toInt(&ok);
            if (!ok || timeoutMs <= 0) {
                std::print(stderr, "Timeout must be a positive number of milliseconds\n");
                return 1;
            }
            return modes::runSend(config.port, parser.value(optSend), parser.value(optParams), timeoutMs);
        }

        // No CLI command - default to serving
        return modes::runServe(app, config);
    }

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("agent-canvas-relay");
    app.setApplicationVersion("0.1.0");

    return runCli(app);
}
