#pragma once
/**
 * @file types.h
 * @brief Common type definitions for the Log Watchdog
 */

#include <string>
#include <vector>

namespace log_watchdog {

/**
 * @brief ROI (Region of Interest) configuration
 */
struct ROI {
    std::string name;   ///< ROI identifier (e.g., "tribe_log")
    int x = 0;          ///< Top-left X coordinate (virtual screen)
    int y = 0;          ///< Top-left Y coordinate (virtual screen)
    int w = 0;          ///< Width in pixels
    int h = 0;          ///< Height in pixels
};

/**
 * @brief Axis-aligned box in (scaled) frame pixels
 */
struct BBox {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int bottom() const { return y + h; }
    int right() const { return x + w; }

    bool operator==(const BBox& o) const {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }
    bool operator!=(const BBox& o) const { return !(*this == o); }
};

/**
 * @brief One recognized word from the OCR engine (TSV word row)
 */
struct OcrWord {
    std::string text;
    int confidence = -1;    ///< 0-100, or -1 when unknown
    BBox box;
    int page = 0;
    int block = 0;
    int paragraph = 0;
    int line = 0;
    int word = 0;
};

/**
 * @brief Words of one OCR text line joined in reading order
 */
struct TextLine {
    std::string text;
    float confidence = 0.0f;  ///< Median of valid word confidences
    BBox box;                 ///< Union of word boxes
};

/**
 * @brief Vertical slice of the frame that holds one log record
 */
struct LogEntry {
    BBox box;
    std::string headerText;
    BBox headerBox;
};

/**
 * @brief Full text of an entry after the second OCR pass
 */
struct ResolvedEntry {
    std::string text;
    float confidence = 0.0f;
};

/**
 * @brief How a trigger compares its pattern against entry text
 */
enum class MatchType {
    KEYWORD,
    REGEX
};

/**
 * @brief Which mention (if any) is prepended to a notification
 */
enum class MentionMode {
    NONE,
    HERE,
    EVERYONE,
    CUSTOM
};

/**
 * @brief Trigger as written in the configuration file
 */
struct TriggerConfig {
    std::string name;
    MatchType type = MatchType::KEYWORD;
    std::string match;
    MentionMode mentionMode = MentionMode::NONE;
    std::string mentionCustom;
    std::string prefix;
    std::string suffix;
};

/**
 * @brief Mention categories the webhook platform is allowed to resolve
 */
struct AllowedMentions {
    bool everyone = false;
    bool roles = false;
    bool users = false;
    std::vector<std::string> roleIds;
    std::vector<std::string> userIds;
};

/**
 * @brief Dedup policy used by the watch loop
 */
enum class DedupMode {
    HEADER,     ///< Timestamp/header key, remembered for the whole run
    CONTENT     ///< Content hash, remembered for a limited time
};

/**
 * @brief Configuration for the watch pipeline
 *
 * Built once by loadWatchConfig() and read-only afterwards.
 */
struct WatchConfig {
    // Capture
    ROI roi;                                ///< Capture rectangle (w/h 0 = unset)
    int captureIntervalMs = 750;            ///< Target cycle time
    bool sendOnlyNewest = true;             ///< Only process the topmost entry per frame

    // OCR
    double ocrScale = 2.0;                  ///< Upscale factor before recognition
    int psmLines = 6;                       ///< Page segmentation for line detection
    int reocrPsm = 6;                       ///< Page segmentation for entry re-OCR
    int minWordConf = 0;                    ///< Drop words below this confidence
    std::string tesseractWhitelist;         ///< tessedit_char_whitelist (empty = all)
    std::string tesseractLanguage = "eng";
    std::string tessdataPath;               ///< Empty = TESSDATA_PREFIX / default

    // Entry segmentation
    bool tightenColumns = true;
    int entryBboxPadLr = 4;
    int entryBboxPadV = 0;
    int entryMaxHeightPx = 360;
    std::string entryHeaderRegex =
        R"((?i)\bday\s*\d{1,6}\s*,\s*\d{1,2}[:;]\d{2}[:;]\d{2}\s*[:;]?)";
    std::string entryHeaderKeyword = "day";

    // Triggers
    std::vector<TriggerConfig> triggers;
    std::vector<std::string> keywords;      ///< Legacy keywords
    std::string keywordsFile;
    std::vector<std::string> regexPatterns; ///< Legacy regex patterns

    // Dedup
    DedupMode dedupMode = DedupMode::HEADER;
    int contentDedupTtlS = 60;
    int contentDedupMax = 512;

    // Notification
    std::string webhookUrl;
    AllowedMentions allowedMentions;
    std::string attachmentName = "ark_log_hit.png";

    // Local copies of posted captures
    bool saveCaptures = true;
    std::string captureDir = "captures";

    std::string logLevel = "info";
};

} // namespace log_watchdog
