#include "IdleTimer.hpp"

#include <algorithm>
#include <limits>

namespace canvas::relay {

    namespace {

        // QTimer intervals are int milliseconds
        std::chrono::milliseconds clampInterval(std::chrono::milliseconds duration) {
            const std::chrono::milliseconds maxInterval(std::numeric_limits<int>::max());
            return std::clamp(duration, std::chrono::milliseconds::zero(), maxInterval);
        }

    } // namespace

    IdleTimer::IdleTimer(std::chrono::milliseconds duration, QObject* parent) : QObject(parent), m_duration(clampInterval(duration)) {
        m_timer.setSingleShot(true);
        connect(&m_timer, &QTimer::timeout, this, &IdleTimer::onTimeout);
    }

    void IdleTimer::start() {
        touch();
    }

    void IdleTimer::touch() {
        // Once fired the shutdown is under way; a late touch must not re-arm it
        if (!isEnabled() || m_fired)
            return;

        m_timer.start(m_duration);
    }

    void IdleTimer::stop() {
        m_timer.stop();
    }

    bool IdleTimer::isEnabled() const {
        return m_duration > std::chrono::milliseconds::zero();
    }

    bool IdleTimer::isActive() const {
        return m_timer.isActive();
    }

    bool IdleTimer::hasFired() const {
        return m_fired;
    }

    std::chrono::milliseconds IdleTimer::duration() const {
        return m_duration;
    }

    void IdleTimer::onTimeout() {
        m_fired = true;
        emit expired();
    }

} // namespace canvas::relay
