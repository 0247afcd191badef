#include "PendingRequests.hpp"
#include "../../common/Envelope.hpp"

#include <QDateTime>

#include <algorithm>
#include <utility>

namespace canvas::relay {

    PendingRequest::State PendingRequest::state() const {
        if (!requester || requester->state() != QAbstractSocket::ConnectedState) {
            return State::Orphaned;
        }
        return State::Forwarded;
    }

    PendingRequests::PendingRequests() : PendingRequests([] { return QDateTime::currentMSecsSinceEpoch(); }) {}

    PendingRequests::PendingRequests(NowFn nowFn) : m_nowFn(std::move(nowFn)) {}

    bool PendingRequests::insert(const QJsonValue& id, QWebSocket* requester, const QString& type) {
        if (!isCorrelationId(id) || m_requests.contains(id)) {
            return false;
        }

        PendingRequest request;
        request.id        = id;
        request.type      = type;
        request.requester = requester;
        request.createdMs = m_nowFn();

        m_requests.emplace(id, std::move(request));
        return true;
    }

    std::optional<PendingRequest> PendingRequests::take(const QJsonValue& id) {
        auto it = m_requests.find(id);
        if (it == m_requests.end()) {
            return std::nullopt;
        }

        PendingRequest request = std::move(it->second);
        m_requests.erase(it);
        return request;
    }

    bool PendingRequests::contains(const QJsonValue& id) const {
        return m_requests.contains(id);
    }

    const PendingRequest* PendingRequests::find(const QJsonValue& id) const {
        auto it = m_requests.find(id);
        return (it != m_requests.end()) ? &it->second : nullptr;
    }

    std::size_t PendingRequests::orphanCount() const {
        return std::count_if(m_requests.begin(), m_requests.end(), [](const auto& entry) { return entry.second.state() == PendingRequest::State::Orphaned; });
    }

    std::size_t PendingRequests::countForRequester(QWebSocket* requester) const {
        return std::count_if(m_requests.begin(), m_requests.end(), [requester](const auto& entry) { return entry.second.requester == requester; });
    }

    bool PendingRequests::empty() const {
        return m_requests.empty();
    }

    std::size_t PendingRequests::size() const {
        return m_requests.size();
    }

} // namespace canvas::relay
