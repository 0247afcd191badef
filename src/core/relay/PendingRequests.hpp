#pragma once

#include <QJsonValue>
#include <QPointer>
#include <QString>
#include <QWebSocket>

#include <functional>
#include <optional>
#include <unordered_map>

namespace canvas::relay {

    // A command forwarded to the browser and not yet answered
    struct PendingRequest {
        enum class State {
            Forwarded,
            Orphaned // requester went away before the answer arrived
        };

        QJsonValue           id;
        QString              type;
        QPointer<QWebSocket> requester;
        qint64               createdMs = 0;

        [[nodiscard]] State state() const;
    };

    struct CorrelationIdHash {
        std::size_t operator()(const QJsonValue& id) const {
            return qHash(id);
        }
    };

    // Correlation id -> waiting connection. Ids keep their JSON type, so "7" and 7
    // are different requests. Entries have no expiry: an entry whose requester
    // disconnected stays until the browser answers it.
    class PendingRequests {
      public:
        using NowFn      = std::function<qint64()>;
        using RequestMap = std::unordered_map<QJsonValue, PendingRequest, CorrelationIdHash>;

        PendingRequests();
        explicit PendingRequests(NowFn nowFn);

        // Returns false and keeps the existing entry when `id` is already pending
        // or is not a usable correlation id
        bool                          insert(const QJsonValue& id, QWebSocket* requester, const QString& type = {});
        std::optional<PendingRequest> take(const QJsonValue& id);

        bool                          contains(const QJsonValue& id) const;
        const PendingRequest*         find(const QJsonValue& id) const;
        std::size_t                   orphanCount() const;
        std::size_t                   countForRequester(QWebSocket* requester) const;
        bool                          empty() const;
        std::size_t                   size() const;

      private:
        NowFn      m_nowFn;
        RequestMap m_requests;
    };

} // namespace canvas::relay
