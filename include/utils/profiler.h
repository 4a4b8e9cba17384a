#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace log_watchdog {

struct FrameProfileRow {
    uint64_t frameNumber = 0;
    double totalMs = 0.0;
    double captureMs = 0.0;
    double linesMs = 0.0;
    double segmentMs = 0.0;
    double reocrMs = 0.0;
    double notifyMs = 0.0;
    int headers = 0;
    int posted = 0;
};

class Profiler {
public:
    explicit Profiler(bool enabled) : m_enabled(enabled) {}

    bool enabled() const { return m_enabled; }

    void beginFrame(uint64_t frameNumber);
    void markCapture();
    void markLines();
    void markSegment(int headers);
    void markReocr();
    void markNotify(int posted);
    void endFrame();

    const std::vector<FrameProfileRow>& rows() const { return m_rows; }

    void flush(const std::string& jsonPath, const std::string& summaryPath);

private:
    using Clock = std::chrono::steady_clock;

    double sinceLast();

    bool m_enabled = false;
    Clock::time_point m_t0{};
    Clock::time_point m_last{};
    std::vector<FrameProfileRow> m_rows;
};

} // namespace log_watchdog
