#include "../src/common/Constants.hpp"
#include "../src/common/Envelope.hpp"
#include "../src/common/RelayClient.hpp"

#include <QtTest/QtTest>
#include <QCoreApplication>
#include <QRegularExpression>
#include <QSet>

int runConfigTests(int argc, char** argv);
int runIdleTimerTests(int argc, char** argv);
int runRelayRoutingTests(int argc, char** argv);
int runRelayTests(int argc, char** argv);

class EnvelopeTest : public QObject {
    Q_OBJECT

  private slots:
    void parseKeepsRawTextAndFields();
    void parseTreatsNonStringFieldsAsAbsent();
    void parseKeepsNumberIds();
    void parseRejectsNonObjects();
    void failureReplyCarriesRequestId();
    void generatedIdsAreShortAndUnique();
};

void EnvelopeTest::parseKeepsRawTextAndFields() {
    const QString text     = R"({"type":"addShape","id":"r1","params":{"x":1}})";
    const auto    envelope = canvas::parseEnvelope(text);

    QVERIFY(envelope.has_value());
    QCOMPARE(envelope->type, QString("addShape"));
    QCOMPARE(envelope->id.toString(), QString("r1"));
    QCOMPARE(envelope->raw, text);
    QCOMPARE(envelope->body.value("params").toObject().value("x").toInt(), 1);
    QVERIFY(envelope->hasType());
    QVERIFY(envelope->hasId());
}

void EnvelopeTest::parseTreatsNonStringFieldsAsAbsent() {
    const auto envelope = canvas::parseEnvelope(R"({"type":7,"id":null,"success":true})");

    QVERIFY(envelope.has_value());
    QVERIFY(!envelope->hasType());
    QVERIFY(!envelope->hasId());
}

void EnvelopeTest::parseKeepsNumberIds() {
    const auto envelope = canvas::parseEnvelope(R"({"type":"addShape","id":42})");

    QVERIFY(envelope.has_value());
    QVERIFY(envelope->hasId());
    QVERIFY(envelope->id.isDouble());
    QCOMPARE(envelope->id.toInt(), 42);

    QVERIFY(!canvas::isCorrelationId(QJsonValue(0)));
    QVERIFY(!canvas::isCorrelationId(QJsonValue(QString())));
    QVERIFY(!canvas::isCorrelationId(QJsonValue(true)));
    QVERIFY(!canvas::isCorrelationId(QJsonValue(QJsonObject{{"n", 1}})));
}

void EnvelopeTest::parseRejectsNonObjects() {
    QVERIFY(!canvas::parseEnvelope("").has_value());
    QVERIFY(!canvas::parseEnvelope("{\"type\":").has_value());
    QVERIFY(!canvas::parseEnvelope("[]").has_value());
    QVERIFY(!canvas::parseEnvelope("\"ping\"").has_value());
}

void EnvelopeTest::failureReplyCarriesRequestId() {
    const auto reply = canvas::parseEnvelope(canvas::toText(canvas::makeFailure("abc", canvas::BROWSER_NOT_CONNECTED_ERROR)));

    QVERIFY(reply.has_value());
    QCOMPARE(reply->id.toString(), QString("abc"));
    QVERIFY(!reply->hasType());
    QCOMPARE(reply->body.value("success").toBool(true), false);
    QCOMPARE(reply->body.value("error").toString(), QString("Browser not connected. Please open the canvas in your browser."));
}

void EnvelopeTest::generatedIdsAreShortAndUnique() {
    static const QRegularExpression idPattern("^[a-z0-9]+$");

    QSet<QString>                   ids;
    for (int i = 0; i < 100; ++i) {
        const QString id = canvas::RelayClient::generateId();
        QCOMPARE(id.size(), qsizetype(12));
        QVERIFY(idPattern.match(id).hasMatch());
        ids.insert(id);
    }
    QCOMPARE(ids.size(), qsizetype(100));
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    EnvelopeTest     envelopeTest;
    const int        envelopeResult = QTest::qExec(&envelopeTest, argc, argv);
    const int        configResult   = runConfigTests(argc, argv);
    const int        timerResult    = runIdleTimerTests(argc, argv);
    const int        routingResult  = runRelayRoutingTests(argc, argv);
    const int        relayResult    = runRelayTests(argc, argv);

    for (const int result : {envelopeResult, configResult, timerResult, routingResult, relayResult}) {
        if (result != 0) {
            return result;
        }
    }
    return 0;
}

#include "test_envelope.moc"
