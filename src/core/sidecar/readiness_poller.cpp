#include "core/sidecar/readiness_poller.h"

#include <QThread>

#include <algorithm>

namespace oni {

SteadyClock::SteadyClock()
{
    m_timer.start();
}

qint64 SteadyClock::nowMs() const
{
    return m_timer.elapsed();
}

void SteadyClock::sleepMs(int ms)
{
    if (ms > 0) {
        QThread::msleep(static_cast<unsigned long>(ms));
    }
}

ReadinessPoller::ReadinessPoller(Clock& clock, int intervalMs, int timeoutMs)
    : m_clock(clock)
    , m_intervalMs(std::max(1, intervalMs))
    , m_timeoutMs(std::max(0, timeoutMs))
{
}

ReadinessPoller::Result ReadinessPoller::waitUntilReady(const Probe& probe)
{
    Result result;
    const qint64 startedAt = m_clock.nowMs();
    auto elapsed = [this, startedAt]() { return m_clock.nowMs() - startedAt; };

    while (elapsed() < m_timeoutMs) {
        if (m_cancelled.load()) {
            result.outcome = Outcome::Cancelled;
            result.elapsedMs = elapsed();
            return result;
        }

        // Never sleep past the deadline.
        m_clock.sleepMs(static_cast<int>(std::min<qint64>(m_intervalMs, m_timeoutMs - elapsed())));

        if (m_cancelled.load()) {
            result.outcome = Outcome::Cancelled;
            result.elapsedMs = elapsed();
            return result;
        }

        ++result.attempts;
        const int remainingMs =
            static_cast<int>(std::max<qint64>(0, m_timeoutMs - elapsed()));
        if (probe && probe(remainingMs)) {
            result.outcome = Outcome::Ready;
            result.elapsedMs = elapsed();
            return result;
        }
    }

    result.outcome = Outcome::TimedOut;
    result.elapsedMs = elapsed();
    return result;
}

void ReadinessPoller::cancel()
{
    m_cancelled.store(true);
}

void ReadinessPoller::reset()
{
    m_cancelled.store(false);
}

bool ReadinessPoller::isCancelled() const
{
    return m_cancelled.load();
}

} // namespace oni
