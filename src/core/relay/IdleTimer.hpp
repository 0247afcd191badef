#pragma once

#include <QObject>
#include <QTimer>

#include <chrono>

namespace canvas::relay {

    // Resettable countdown. `expired` fires once, after `duration` without a touch().
    // A zero duration disables the timer.
    class IdleTimer : public QObject {
        Q_OBJECT

      public:
        explicit IdleTimer(std::chrono::milliseconds duration, QObject* parent = nullptr);

        void                      start();
        void                      touch();
        void                      stop();

        bool                      isEnabled() const;
        bool                      isActive() const;
        bool                      hasFired() const;
        std::chrono::milliseconds duration() const;

      signals:
        void expired();

      private:
        void                      onTimeout();

        QTimer                    m_timer;
        std::chrono::milliseconds m_duration;
        bool                      m_fired = false;
    };

} // namespace canvas::relay
