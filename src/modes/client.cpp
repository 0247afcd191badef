#include "client.hpp"
#include "../common/RelayClient.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <print>

namespace modes {

    int runPing(quint16 port) {
        canvas::RelayClient client(port);
        if (!client.ping()) {
            std::print(stderr, "Relay not reachable on port {}\n", port);
            return 1;
        }

        std::print("pong\n");
        return 0;
    }

    int runStatus(quint16 port) {
        canvas::RelayClient client(port);
        const auto          connected = client.isBrowserConnected();
        if (!connected) {
            std::print(stderr, "Relay not reachable on port {}\n", port);
            return 1;
        }

        std::print("{}\n", *connected ? "connected" : "disconnected");
        return 0;
    }

    int runSend(quint16 port, const QString& type, const QString& paramsJson, int timeoutMs) {
        QJsonObject request{{"type", type}, {"id", canvas::RelayClient::generateId()}};

        if (!paramsJson.isEmpty()) {
            QJsonParseError parseError;
            const auto      doc = QJsonDocument::fromJson(paramsJson.toUtf8(), &parseError);
            if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
                std::print(stderr, "Invalid --params: expected a JSON object ({})\n", parseError.errorString().toStdString());
                return 1;
            }
            request["params"] = doc.object();
        }

        canvas::RelayClient client(port);
        const auto          response = client.sendRequest(request, timeoutMs);
        if (!response) {
            std::print(stderr, "No reply from relay on port {}\n", port);
            return 1;
        }

        std::print("{}\n", QJsonDocument(*response).toJson(QJsonDocument::Compact).toStdString());
        return response->value("success").toBool() ? 0 : 1;
    }

} // namespace modes
