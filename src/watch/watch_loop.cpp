/**
 * @file watch_loop.cpp
 * @brief Watch cycle implementation
 */

#include "watch/watch_loop.h"
#include "detection/word_grouper.h"
#include "processing/roi_extractor.h"
#include "utils/logger.h"
#include "utils/string_utils.h"
#include "utils/timer.h"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <sstream>
#include <thread>

namespace log_watchdog {

namespace {

constexpr size_t kSampleChars = 200;

std::string sample(const std::string& s, size_t n = kSampleChars) {
    return s.size() <= n ? s : s.substr(0, n) + "...";
}

std::string timestampForFile() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
    return buf;
}

} // namespace

std::string formatNotification(const detect::Trigger& trigger,
                               const std::string& text,
                               float confidence,
                               const std::string& matchedPattern) {
    std::ostringstream oss;
    std::string mention = detect::buildMention(trigger);
    if (!mention.empty()) oss << mention << "\n";
    if (!trigger.prefix.empty()) oss << trigger.prefix << "\n";
    oss << "**ARK Watchdog match**\n";
    oss << "- [" << static_cast<int>(confidence) << "%] " << text
        << " (match: " << (matchedPattern.empty() ? "trigger" : matchedPattern) << ")";
    if (!trigger.suffix.empty()) oss << "\n" << trigger.suffix;
    return oss.str();
}

WatchLoop::WatchLoop(const WatchConfig& config, ScreenCapture& capture,
                     OcrEngine& ocr, Notifier& notifier)
    : m_config(config)
    , m_capture(capture)
    , m_ocr(ocr)
    , m_notifier(notifier)
    , m_headerRe(detect::compileHeaderRegex(config.entryHeaderRegex))
    , m_triggers(config.triggers, config.keywords, config.regexPatterns)
    , m_contentSeen(config.contentDedupTtlS,
                    static_cast<size_t>((std::max)(1, config.contentDedupMax))) {
    m_segmentConfig.padLr = config.entryBboxPadLr;
    m_segmentConfig.padV = config.entryBboxPadV;
    m_segmentConfig.maxHeight = config.entryMaxHeightPx;
}

bool WatchLoop::isDuplicate(const std::string& key, const std::string& text) {
    if (m_config.dedupMode == DedupMode::CONTENT) {
        return m_contentSeen.contains(detect::contentKey(text));
    }
    return m_registry.seen(key);
}

void WatchLoop::markSeen(const std::string& key, const std::string& text) {
    if (m_config.dedupMode == DedupMode::CONTENT) {
        m_contentSeen.add(detect::contentKey(text));
    } else {
        m_registry.mark(key);
    }
}

void WatchLoop::saveCapture(const cv::Mat& frame) const {
    if (!m_config.saveCaptures || frame.empty()) return;
    try {
        std::error_code ec;
        std::filesystem::create_directories(m_config.captureDir, ec);
        std::filesystem::path p =
            std::filesystem::path(m_config.captureDir) / ("hit-" + timestampForFile() + ".png");
        if (!cv::imwrite(p.string(), frame)) {
            logDebug("Could not save capture: " + p.string());
        }
    } catch (const std::exception& e) {
        logDebug(std::string("Could not save capture: ") + e.what());
    }
}

FrameReport WatchLoop::processFrame(uint64_t frameId, Profiler* profiler) {
    FrameReport report;
    if (profiler) profiler->beginFrame(frameId);

    cv::Mat frame;
    if (!m_capture.capture(m_config.roi, frame) || frame.empty()) {
        logError("Capture failed: " + m_capture.getLastError());
        if (profiler) profiler->endFrame();
        return report;
    }
    report.captured = true;
    if (profiler) profiler->markCapture();

    // First pass: fast line detection on the upscaled frame.
    cv::Mat scaled = scaleForOcr(frame, m_config.ocrScale);
    OcrParams linesParams;
    linesParams.psm = m_config.psmLines;
    linesParams.scale = 1.0;
    linesParams.whitelist = m_config.tesseractWhitelist;

    std::vector<OcrWord> words;
    if (!m_ocr.recognize(scaled, linesParams, words)) {
        logError("OCR failed: " + m_ocr.getLastError());
        if (profiler) profiler->endFrame();
        return report;
    }
    std::vector<TextLine> lines = detect::groupWordsIntoLines(words, m_config.minWordConf);
    report.ocrLines = static_cast<int>(lines.size());
    if (profiler) profiler->markLines();

    {
        std::ostringstream oss;
        oss << "[frame " << frameId << "] OCR lines: " << lines.size();
        if (!lines.empty()) oss << " | sample: " << sample(detect::joinLinesText(lines), 120);
        logInfo(oss.str());
    }

    std::vector<LogEntry> entries =
        detect::segmentEntries(lines, scaled.cols, scaled.rows, m_headerRe, m_segmentConfig);
    report.headers = static_cast<int>(entries.size());
    if (profiler) profiler->markSegment(report.headers);

    {
        std::ostringstream oss;
        oss << "[frame " << frameId << "] Headers found: " << entries.size();
        for (size_t i = 0; i < entries.size() && i < 3; ++i) {
            oss << " | " << entries[i].headerText;
        }
        logInfo(oss.str());
    }

    if (entries.empty()) {
        if (profiler) profiler->endFrame();
        return report;
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const LogEntry& a, const LogEntry& b) { return a.box.y < b.box.y; });
    if (m_config.sendOnlyNewest) {
        entries.resize(1);
    }
    report.candidates = static_cast<int>(entries.size());

    OcrParams entryParams = linesParams;
    entryParams.psm = m_config.reocrPsm;

    for (const auto& entry : entries) {
        BBox box = entry.box;
        if (m_config.tightenColumns) {
            box = tightenToTextColumns(scaled, box, m_config.entryBboxPadLr);
        }

        cv::Mat crop = cropRegion(scaled, box);
        std::vector<OcrWord> entryWords;
        if (crop.empty() || !m_ocr.recognize(crop, entryParams, entryWords)) {
            if (!crop.empty()) logWarning("Entry re-OCR failed: " + m_ocr.getLastError());
            if (profiler) profiler->markReocr();
            ++report.skipped;
            continue;
        }
        std::vector<TextLine> entryLines =
            detect::groupWordsIntoLines(entryWords, m_config.minWordConf);
        if (profiler) profiler->markReocr();

        ResolvedEntry resolved;
        resolved.text = trim(detect::joinLinesText(entryLines));
        resolved.confidence = detect::medianLineConfidence(entryLines);

        if (resolved.text.empty()) {
            ++report.skipped;
            continue;
        }

        // Cropping can cut the header off the second pass; restore it.
        if (!detect::isHeaderLine(resolved.text, m_headerRe)) {
            std::string hdr = trim(entry.headerText);
            if (!m_config.entryHeaderKeyword.empty() &&
                startsWith(toLower(hdr), toLower(m_config.entryHeaderKeyword))) {
                resolved.text = trim(hdr + " " + resolved.text);
            } else {
                logDebug("Header not recoverable, skipping entry: " + sample(resolved.text, 80));
                ++report.skipped;
                continue;
            }
        }

        std::string key = detect::canonicalKey(resolved.text, entry.headerText);
        if (isDuplicate(key, resolved.text)) {
            logInfo("Skip duplicate " + key);
            ++report.duplicates;
            continue;
        }

        detect::TriggerMatch match = m_triggers.resolve(resolved.text);
        if (!match) {
            logInfo("No trigger match for " + key + ": " + sample(resolved.text, 80));
            ++report.unmatched;
            continue;
        }

        markSeen(key, resolved.text);

        NotificationMessage msg;
        msg.content = formatNotification(*match.trigger, resolved.text,
                                         resolved.confidence, match.matchedPattern);
        msg.filename = m_config.attachmentName;
        msg.allowedMentions = m_config.allowedMentions;
        try {
            if (!cv::imencode(".png", frame, msg.image)) {
                msg.image.clear();
            }
        } catch (const cv::Exception& e) {
            logWarning(std::string("PNG encode failed, sending text only: ") + e.what());
            msg.image.clear();
        }

        if (m_notifier.send(msg)) {
            ++report.posted;
            ++m_totalPosted;
            logInfo("Posted [" + match.trigger->name + "] " + key + ": " + sample(resolved.text));
        } else {
            ++report.notifyFailures;
            ++m_totalNotifyFailures;
            logError("Notify failed for " + key + ": " + m_notifier.getLastError());
        }
        if (profiler) profiler->markNotify(report.posted);

        saveCapture(frame);
    }

    if (profiler) profiler->endFrame();
    return report;
}

uint64_t WatchLoop::run(std::atomic<bool>& running, uint64_t maxFrames, Profiler* profiler) {
    const double intervalMs = static_cast<double>((std::max)(0, m_config.captureIntervalMs));

    HighResTimer cycle;
    uint64_t frames = 0;
    while (running.load()) {
        cycle.start();
        processFrame(frames, profiler);
        ++frames;

        if (maxFrames > 0 && frames >= maxFrames) break;

        // Sleep in short slices so a stop request is seen promptly.
        double remainingMs = intervalMs - cycle.currentElapsedMs();
        while (running.load() && remainingMs > 0.0) {
            const double sliceMs = (std::min)(remainingMs, 100.0);
            std::this_thread::sleep_for(std::chrono::microseconds(static_cast<long long>(sliceMs * 1000.0)));
            remainingMs = intervalMs - cycle.currentElapsedMs();
        }
    }
    return frames;
}

} // namespace log_watchdog
