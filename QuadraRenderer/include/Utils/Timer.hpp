// QuadraRenderer/include/Utils/Timer.hpp
#pragma once

#include <chrono>
#include <cstdint>

namespace Quadra {

/**
 * @brief Steady-clock stopwatch
 *
 * Elapsed time keeps running until stop() is called.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer();

    void start();
    void stop();
    void restart() { start(); }

    bool isRunning() const { return m_running; }

    double getElapsedSeconds() const;
    double getElapsedMilliseconds() const;

    // Whole intervals of the given length elapsed since the last call,
    // used to advance fixed-rate logic
    uint32_t consumeTicks(double interval_seconds);

private:
    Clock::time_point m_start_time;
    Clock::time_point m_end_time;
    double m_consumed_seconds = 0.0;
    bool m_running = false;
};

} // namespace Quadra
