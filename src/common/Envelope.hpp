#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

namespace canvas {

    // Envelope types the relay interprets itself. Any other type is a canvas command.
    inline constexpr const char* TYPE_BROWSER_CONNECT      = "browserConnect";
    inline constexpr const char* TYPE_PING                 = "ping";
    inline constexpr const char* TYPE_PONG                 = "pong";
    inline constexpr const char* TYPE_IS_BROWSER_CONNECTED = "isBrowserConnected";
    inline constexpr const char* TYPE_BROWSER_STATUS       = "browserStatus";

    // Correlation ids are opaque: a non-empty string or a non-zero number
    bool isCorrelationId(const QJsonValue& id);

    // One JSON text frame as received. `raw` keeps the original text so that
    // forwarded commands and responses reach the peer byte for byte.
    struct Envelope {
        QString     type;
        QJsonValue  id;
        QJsonObject body;
        QString     raw;

        [[nodiscard]] bool hasType() const {
            return !type.isEmpty();
        }
        [[nodiscard]] bool hasId() const {
            return isCorrelationId(id);
        }
    };

    // Returns std::nullopt when the frame is not a JSON object.
    // A non-string `type` is treated as absent. `id` keeps its JSON type.
    std::optional<Envelope> parseEnvelope(const QString& text);

    QString                 toText(const QJsonObject& json);

    QJsonObject             makePing();
    QJsonObject             makePong();
    QJsonObject             makeBrowserStatus(bool connected);
    QJsonObject             makeFailure(const QJsonValue& id, const QString& error);

} // namespace canvas
