#include "../src/common/Envelope.hpp"
#include "../src/common/RelayClient.hpp"
#include "../src/core/Relay.hpp"
#include "../src/modes/client.hpp"

#include <QtTest/QtTest>

#include <QJsonDocument>
#include <QJsonObject>
#include <QWebSocket>

#include <chrono>
#include <memory>
#include <optional>

namespace canvas {

    namespace {

        RelayConfig testConfig(std::chrono::seconds idleTimeout = std::chrono::seconds(0)) {
            RelayConfig config;
            config.port        = 0;
            config.idleTimeout = idleTimeout;
            return config;
        }

        QUrl relayUrl(const CRelay& relay) {
            return QUrl(QStringLiteral("ws://127.0.0.1:%1").arg(relay.port()));
        }

        // Browser stand-in: declares itself, then answers every command with
        // `{id, success:true, elementId:"el-<n>"}`
        std::unique_ptr<QWebSocket> openBrowser(const CRelay& relay) {
            auto        browser = std::make_unique<QWebSocket>();
            QWebSocket* raw     = browser.get();

            QObject::connect(raw, &QWebSocket::connected, raw, [raw]() { raw->sendTextMessage(toText(QJsonObject{{"type", TYPE_BROWSER_CONNECT}})); });

            auto counter = std::make_shared<int>(0);
            QObject::connect(raw, &QWebSocket::textMessageReceived, raw, [raw, counter](const QString& text) {
                const auto envelope = parseEnvelope(text);
                if (!envelope || !envelope->hasId())
                    return;

                ++*counter;
                raw->sendTextMessage(toText(QJsonObject{{"id", envelope->id}, {"success", true}, {"elementId", QStringLiteral("el-%1").arg(*counter)}}));
            });

            browser->open(relayUrl(relay));
            return browser;
        }

    } // namespace

    class RelayTest : public QObject {
        Q_OBJECT

      private slots:
        void pingOverWebSocket();
        void statusFollowsBrowserLifecycle();
        void commandWithoutBrowserFailsWithFixedError();
        void commandRoundTripThroughBrowser();
        void idleShutdownClosesEverything();
        void startFailsWhenPortIsTaken();
        void oversizedIdleTimeoutStaysEnabled();
        void statusExitCodes();
        void sendExitCodes();
    };

    void RelayTest::pingOverWebSocket() {
        CRelay relay(testConfig(), [] {});
        QVERIFY(relay.start(QHostAddress::LocalHost));
        QVERIFY(relay.port() != 0);

        RelayClient client(relayUrl(relay));
        QVERIFY(client.isRelayRunning());
        QVERIFY(client.ping());
    }

    void RelayTest::statusFollowsBrowserLifecycle() {
        CRelay relay(testConfig(), [] {});
        QVERIFY(relay.start(QHostAddress::LocalHost));

        RelayClient client(relayUrl(relay));
        auto        status = client.isBrowserConnected();
        QVERIFY(status.has_value());
        QVERIFY(!*status);

        auto browser = openBrowser(relay);
        QTRY_VERIFY(relay.registry().isConnected());
        status = client.isBrowserConnected();
        QVERIFY(status.has_value());
        QVERIFY(*status);

        browser->close();
        QTRY_VERIFY(relay.registry().current() == nullptr);
        status = client.isBrowserConnected();
        QVERIFY(status.has_value());
        QVERIFY(!*status);
    }

    void RelayTest::commandWithoutBrowserFailsWithFixedError() {
        CRelay relay(testConfig(), [] {});
        QVERIFY(relay.start(QHostAddress::LocalHost));

        RelayClient client(relayUrl(relay));
        const auto  reply = client.sendRequest(QJsonObject{{"type", "clear"}, {"id", "q7"}}, 2000);

        QVERIFY(reply.has_value());
        QCOMPARE(reply->value("id").toString(), QString("q7"));
        QCOMPARE(reply->value("success").toBool(true), false);
        QCOMPARE(reply->value("error").toString(), QString(BROWSER_NOT_CONNECTED_ERROR));
        QVERIFY(relay.pending().empty());
    }

    void RelayTest::commandRoundTripThroughBrowser() {
        CRelay relay(testConfig(), [] {});
        QVERIFY(relay.start(QHostAddress::LocalHost));

        auto browser = openBrowser(relay);
        QTRY_VERIFY(relay.registry().isConnected());

        RelayClient       client(relayUrl(relay));
        const QJsonObject params{{"type", "rectangle"}, {"x", 10}, {"y", 20}};
        const auto        reply = client.sendRequest(QJsonObject{{"type", "addShape"}, {"id", "r1"}, {"params", params}}, 2000);

        QVERIFY(reply.has_value());
        QCOMPARE(reply->value("id").toString(), QString("r1"));
        QCOMPARE(reply->value("success").toBool(), true);
        QCOMPARE(reply->value("elementId").toString(), QString("el-1"));
        QVERIFY(!relay.pending().contains("r1"));
    }

    void RelayTest::idleShutdownClosesEverything() {
        bool   shutdownCalled = false;
        CRelay relay(testConfig(std::chrono::seconds(1)), [&shutdownCalled] { shutdownCalled = true; });
        QVERIFY(relay.start(QHostAddress::LocalHost));
        QVERIFY(relay.idleTimer().isActive());

        QWebSocket idleClient;
        idleClient.open(relayUrl(relay));
        QTRY_COMPARE(idleClient.state(), QAbstractSocket::ConnectedState);

        QTRY_VERIFY_WITH_TIMEOUT(shutdownCalled, 5000);
        QVERIFY(!relay.isListening());
        QTRY_COMPARE(idleClient.state(), QAbstractSocket::UnconnectedState);
    }

    void RelayTest::startFailsWhenPortIsTaken() {
        CRelay first(testConfig(), [] {});
        QVERIFY(first.start(QHostAddress::LocalHost));

        RelayConfig config = testConfig();
        config.port        = first.port();

        CRelay second(config, [] {});
        QVERIFY(!second.start(QHostAddress::LocalHost));
        QVERIFY(!second.isListening());
    }

    void RelayTest::oversizedIdleTimeoutStaysEnabled() {
        CRelay relay(testConfig(std::chrono::seconds::max()), [] {});

        QVERIFY(relay.idleTimer().isEnabled());
        QVERIFY(relay.idleTimer().duration() == std::chrono::duration_cast<std::chrono::milliseconds>(MAX_IDLE_TIMEOUT));
    }

    void RelayTest::statusExitCodes() {
        quint16 port = 0;
        {
            // The client modes dial localhost, so listen on every interface
            CRelay relay(testConfig(), [] {});
            QVERIFY(relay.start(QHostAddress::Any));
            port = relay.port();

            QCOMPARE(modes::runStatus(port), 0);
            QCOMPARE(modes::runPing(port), 0);
        }

        // Nothing listens on the port any more
        QCOMPARE(modes::runStatus(port), 1);
        QCOMPARE(modes::runPing(port), 1);
    }

    void RelayTest::sendExitCodes() {
        CRelay relay(testConfig(), [] {});
        QVERIFY(relay.start(QHostAddress::Any));

        // No browser: the failure reply maps to 1
        QCOMPARE(modes::runSend(relay.port(), "clear", QString(), 2000), 1);

        // Params that are not a JSON object never reach the relay
        QCOMPARE(modes::runSend(relay.port(), "addShape", "[1,2]", 2000), 1);
        QCOMPARE(modes::runSend(relay.port(), "addShape", "{bad", 2000), 1);

        auto browser = openBrowser(relay);
        QTRY_VERIFY(relay.registry().isConnected());

        QCOMPARE(modes::runSend(relay.port(), "addShape", R"({"type":"rectangle","x":10,"y":20})", 2000), 0);
        QVERIFY(relay.pending().empty());
    }

} // namespace canvas

int runRelayTests(int argc, char** argv) {
    canvas::RelayTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_relay.moc"
