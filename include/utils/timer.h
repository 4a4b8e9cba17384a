#pragma once
/**
 * @file timer.h
 * @brief Timing utilities for cycle cadence and stage measurement
 */

#include <chrono>

namespace log_watchdog {

/**
 * @brief Monotonic CPU timer
 */
class HighResTimer {
public:
    using Clock = std::chrono::steady_clock;

    HighResTimer() : m_start(Clock::now()), m_stop(m_start) {}

    void start() {
        m_start = Clock::now();
    }

    void stop() {
        m_stop = Clock::now();
    }

    double elapsedMs() const {
        return std::chrono::duration<double, std::milli>(m_stop - m_start).count();
    }

    double currentElapsedMs() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - m_start).count();
    }

private:
    Clock::time_point m_start;
    Clock::time_point m_stop;
};

/**
 * @brief RAII timer for automatic scope timing
 */
class ScopedTimer {
public:
    explicit ScopedTimer(double& output) : m_output(output) {
        m_timer.start();
    }

    ~ScopedTimer() {
        m_timer.stop();
        m_output = m_timer.elapsedMs();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    HighResTimer m_timer;
    double& m_output;
};

} // namespace log_watchdog
