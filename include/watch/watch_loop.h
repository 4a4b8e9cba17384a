#pragma once
/**
 * @file watch_loop.h
 * @brief Capture -> segment -> dedup -> trigger -> notify cycle
 */

#include "types.h"
#include "capture/screen_capture.h"
#include "detection/dedup_registry.h"
#include "detection/entry_segmenter.h"
#include "detection/trigger_resolver.h"
#include "notify/notifier.h"
#include "ocr/ocr_engine.h"
#include "utils/profiler.h"

#include <atomic>
#include <cstdint>
#include <regex>
#include <string>

namespace log_watchdog {

/**
 * @brief Outcome counters for one processed frame
 */
struct FrameReport {
    bool captured = false;
    int ocrLines = 0;
    int headers = 0;
    int candidates = 0;         ///< Entries considered after "only newest"
    int posted = 0;
    int duplicates = 0;
    int unmatched = 0;
    int skipped = 0;            ///< Empty text or header not recoverable
    int notifyFailures = 0;
};

/**
 * @brief Build the notification text for a matched entry
 *
 * Lines: mention (if any), prefix (if any), banner, result line, suffix (if any).
 */
std::string formatNotification(const detect::Trigger& trigger,
                               const std::string& text,
                               float confidence,
                               const std::string& matchedPattern);

/**
 * @brief Single-threaded watch worker
 *
 * Owns the dedup state for its lifetime. Collaborators are borrowed and
 * must outlive the loop.
 */
class WatchLoop {
public:
    WatchLoop(const WatchConfig& config, ScreenCapture& capture,
              OcrEngine& ocr, Notifier& notifier);

    WatchLoop(const WatchLoop&) = delete;
    WatchLoop& operator=(const WatchLoop&) = delete;

    /**
     * @brief Run one capture cycle
     * @param frameId Frame number used in diagnostics
     * @param profiler Optional stage timing sink
     */
    FrameReport processFrame(uint64_t frameId, Profiler* profiler = nullptr);

    /**
     * @brief Loop until @p running is cleared or @p maxFrames are processed
     *
     * Cycle time is at least captureIntervalMs; there is no catch-up.
     *
     * @param maxFrames 0 = unlimited
     * @return Number of processed frames
     */
    uint64_t run(std::atomic<bool>& running, uint64_t maxFrames = 0,
                 Profiler* profiler = nullptr);

    const detect::DedupRegistry& registry() const { return m_registry; }
    const detect::TriggerSet& triggers() const { return m_triggers; }
    const WatchConfig& config() const { return m_config; }

    /// Totals across all processed frames
    int totalPosted() const { return m_totalPosted; }
    int totalNotifyFailures() const { return m_totalNotifyFailures; }

private:
    bool isDuplicate(const std::string& key, const std::string& text);
    void markSeen(const std::string& key, const std::string& text);
    void saveCapture(const cv::Mat& frame) const;

    WatchConfig m_config;
    ScreenCapture& m_capture;
    OcrEngine& m_ocr;
    Notifier& m_notifier;

    std::regex m_headerRe;
    detect::EntrySegmentConfig m_segmentConfig;
    detect::TriggerSet m_triggers;
    detect::DedupRegistry m_registry;
    detect::TtlSet m_contentSeen;

    int m_totalPosted = 0;
    int m_totalNotifyFailures = 0;
};

} // namespace log_watchdog
