#pragma once

#include <QElapsedTimer>

#include <atomic>
#include <functional>

namespace oni {

class Clock {
public:
    virtual ~Clock() = default;

    virtual qint64 nowMs() const = 0;
    virtual void sleepMs(int ms) = 0;
};

// Monotonic wall clock backed by QElapsedTimer; sleeps block the thread.
class SteadyClock final : public Clock {
public:
    SteadyClock();

    qint64 nowMs() const override;
    void sleepMs(int ms) override;

private:
    QElapsedTimer m_timer;
};

// Deadline-bounded retry loop. Every cycle waits one interval (cut short at
// the deadline), then asks the probe; the first success ends the wait.
class ReadinessPoller {
public:
    enum class Outcome {
        Ready,
        TimedOut,
        Cancelled,
    };

    struct Result {
        Outcome outcome = Outcome::TimedOut;
        int attempts = 0;
        qint64 elapsedMs = 0;
    };

    // The probe receives the budget left before the deadline (may be 0 on the
    // last cycle).
    using Probe = std::function<bool(int remainingMs)>;

    ReadinessPoller(Clock& clock, int intervalMs, int timeoutMs);

    Result waitUntilReady(const Probe& probe);

    // Safe to call from any thread; the running (or next) wait returns
    // Cancelled at the next cycle boundary until reset() is called.
    void cancel();
    void reset();
    bool isCancelled() const;

    int intervalMs() const { return m_intervalMs; }
    int timeoutMs() const { return m_timeoutMs; }

private:
    Clock& m_clock;
    int m_intervalMs;
    int m_timeoutMs;
    std::atomic<bool> m_cancelled{false};
};

} // namespace oni
