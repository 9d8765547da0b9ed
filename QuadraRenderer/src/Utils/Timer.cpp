// QuadraRenderer/src/Utils/Timer.cpp
#include <Utils/Timer.hpp>

namespace Quadra {

Timer::Timer()
    : m_start_time(Clock::now()),
      m_end_time(m_start_time) {
}

void Timer::start() {
    m_start_time = Clock::now();
    m_end_time = m_start_time;
    m_consumed_seconds = 0.0;
    m_running = true;
}

void Timer::stop() {
    if (!m_running) {
        return;
    }

    m_end_time = Clock::now();
    m_running = false;
}

double Timer::getElapsedSeconds() const {
    auto end = m_running ? Clock::now() : m_end_time;
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start_time);
    return duration.count() / 1000000.0;
}

double Timer::getElapsedMilliseconds() const {
    return getElapsedSeconds() * 1000.0;
}

uint32_t Timer::consumeTicks(double interval_seconds) {
    if (interval_seconds <= 0.0) {
        return 0;
    }

    double pending = getElapsedSeconds() - m_consumed_seconds;
    if (pending < interval_seconds) {
        return 0;
    }

    uint32_t ticks = static_cast<uint32_t>(pending / interval_seconds);
    m_consumed_seconds += ticks * interval_seconds;
    return ticks;
}

} // namespace Quadra
