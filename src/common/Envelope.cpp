#include "Envelope.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

namespace canvas {

    bool isCorrelationId(const QJsonValue& id) {
        if (id.isString())
            return !id.toString().isEmpty();
        if (id.isDouble())
            return id.toDouble() != 0.0;
        return false;
    }

    std::optional<Envelope> parseEnvelope(const QString& text) {
        QJsonParseError parseError;
        const auto      doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);

        if (parseError.error != QJsonParseError::NoError || !doc.isObject())
            return std::nullopt;

        Envelope envelope;
        envelope.body = doc.object();
        envelope.type = envelope.body.value("type").toString();
        envelope.id   = envelope.body.value("id");
        envelope.raw  = text;
        return envelope;
    }

    QString toText(const QJsonObject& json) {
        return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
    }

    QJsonObject makePing() {
        return QJsonObject{{"type", TYPE_PING}};
    }

    QJsonObject makePong() {
        return QJsonObject{{"type", TYPE_PONG}};
    }

    QJsonObject makeBrowserStatus(bool connected) {
        return QJsonObject{{"type", TYPE_BROWSER_STATUS}, {"connected", connected}};
    }

    QJsonObject makeFailure(const QJsonValue& id, const QString& error) {
        return QJsonObject{{"id", id}, {"success", false}, {"error", error}};
    }

} // namespace canvas
