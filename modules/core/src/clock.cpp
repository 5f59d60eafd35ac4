#include "clock.h"

double SteadyClock::wallSeconds() const {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

ManualClock::ManualClock(double wall_start_seconds)
    : m_now(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)),
      m_wall_seconds(wall_start_seconds) {}

Clock::TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

double ManualClock::wallSeconds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_wall_seconds;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_now += delta;
    m_wall_seconds += static_cast<double>(delta.count()) / 1000.0;
}
