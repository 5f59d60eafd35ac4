#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include <mutex>

// Time source injected into everything that reads "now". Timers, liveness and
// stale purge all go through it so tests can drive time by hand.
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    // Seconds since the Unix epoch (wire timestamps, persisted dates).
    virtual double wallSeconds() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
    double wallSeconds() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(double wall_start_seconds = 1700000000.0);

    TimePoint now() const override;
    double wallSeconds() const override;

    void advance(std::chrono::milliseconds delta);

private:
    mutable std::mutex m_mutex;
    TimePoint m_now;
    double m_wall_seconds;
};

#endif // CLOCK_H
