#include "utils/profiler.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace log_watchdog {

static double toMs(std::chrono::steady_clock::duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

double Profiler::sinceLast() {
    auto now = Clock::now();
    double ms = toMs(now - m_last);
    m_last = now;
    return ms;
}

void Profiler::beginFrame(uint64_t frameNumber) {
    if (!m_enabled) return;
    m_t0 = Clock::now();
    m_last = m_t0;
    FrameProfileRow row{};
    row.frameNumber = frameNumber;
    m_rows.push_back(row);
}

void Profiler::markCapture() {
    if (!m_enabled || m_rows.empty()) return;
    m_rows.back().captureMs = sinceLast();
}

void Profiler::markLines() {
    if (!m_enabled || m_rows.empty()) return;
    m_rows.back().linesMs = sinceLast();
}

void Profiler::markSegment(int headers) {
    if (!m_enabled || m_rows.empty()) return;
    m_rows.back().segmentMs = sinceLast();
    m_rows.back().headers = headers;
}

// Re-OCR and notify repeat per entry, so these accumulate.
void Profiler::markReocr() {
    if (!m_enabled || m_rows.empty()) return;
    m_rows.back().reocrMs += sinceLast();
}

void Profiler::markNotify(int posted) {
    if (!m_enabled || m_rows.empty()) return;
    m_rows.back().notifyMs += sinceLast();
    m_rows.back().posted = posted;
}

void Profiler::endFrame() {
    if (!m_enabled || m_rows.empty()) return;
    auto now = Clock::now();
    m_rows.back().totalMs = toMs(now - m_t0);
    m_last = now;
}

static double percentile(std::vector<double> v, double p) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    double idx = p * (v.size() - 1);
    size_t lo = (size_t)std::floor(idx);
    size_t hi = (size_t)std::ceil(idx);
    double a = v[lo];
    double b = v[hi];
    double t = idx - (double)lo;
    return a + (b - a) * t;
}

void Profiler::flush(const std::string& jsonPath, const std::string& summaryPath) {
    if (!m_enabled) return;

    if (!jsonPath.empty()) {
        nlohmann::json frames = nlohmann::json::array();
        for (const auto& r : m_rows) {
            frames.push_back({
                {"frame", r.frameNumber},
                {"total_ms", r.totalMs},
                {"capture_ms", r.captureMs},
                {"lines_ms", r.linesMs},
                {"segment_ms", r.segmentMs},
                {"reocr_ms", r.reocrMs},
                {"notify_ms", r.notifyMs},
                {"headers", r.headers},
                {"posted", r.posted},
            });
        }
        std::ofstream out(jsonPath);
        if (out.good()) {
            out << frames.dump(2) << "\n";
        }
    }

    if (!summaryPath.empty()) {
        std::vector<double> totals; totals.reserve(m_rows.size());
        std::vector<double> lines; lines.reserve(m_rows.size());
        std::vector<double> reocr; reocr.reserve(m_rows.size());
        for (const auto& r : m_rows) {
            totals.push_back(r.totalMs);
            lines.push_back(r.linesMs);
            reocr.push_back(r.reocrMs);
        }
        std::ofstream out(summaryPath);
        if (out.good()) {
            out << std::fixed << std::setprecision(2);
            out << "Frames: " << m_rows.size() << "\n";
            out << "Total ms p50=" << percentile(totals,0.5) << " p90=" << percentile(totals,0.9) << " p99=" << percentile(totals,0.99) << "\n";
            out << "Lines OCR ms p50=" << percentile(lines,0.5) << " p90=" << percentile(lines,0.9) << " p99=" << percentile(lines,0.99) << "\n";
            out << "Re-OCR ms p50=" << percentile(reocr,0.5) << " p90=" << percentile(reocr,0.9) << " p99=" << percentile(reocr,0.99) << "\n";
        }
    }
}

} // namespace log_watchdog
