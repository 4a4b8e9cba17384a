/**
 * @file entry_segmenter.cpp
 * @brief Header based entry segmentation
 */

#include "detection/entry_segmenter.h"
#include "utils/logger.h"
#include "utils/string_utils.h"

#include <algorithm>

namespace log_watchdog::detect {

static const char* kFallbackHeaderPattern = R"(\bday\b)";

std::optional<std::regex> compilePattern(const std::string& pattern, bool forceIcase) {
    if (pattern.empty()) return std::nullopt;

    std::string body = pattern;
    bool icase = forceIcase;
    if (startsWith(body, "(?i)")) {
        body = body.substr(4);
        icase = true;
    }
    if (body.empty()) return std::nullopt;

    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;

    try {
        return std::regex(body, flags);
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

std::regex compileHeaderRegex(const std::string& pattern) {
    auto re = compilePattern(pattern, false);
    if (re) return *re;

    logWarning("Bad entry_header_regex '" + pattern + "', falling back to " + kFallbackHeaderPattern);
    return std::regex(kFallbackHeaderPattern, std::regex::ECMAScript | std::regex::icase);
}

bool isHeaderLine(const std::string& text, const std::regex& headerRe) {
    return !text.empty() && std::regex_search(text, headerRe);
}

std::vector<LogEntry> segmentEntries(const std::vector<TextLine>& lines,
                                     int frameW, int frameH,
                                     const std::regex& headerRe,
                                     const EntrySegmentConfig& cfg) {
    std::vector<LogEntry> entries;
    if (frameW <= 0 || frameH <= 0) return entries;

    std::vector<const TextLine*> ordered;
    ordered.reserve(lines.size());
    for (const auto& ln : lines) ordered.push_back(&ln);
    std::stable_sort(ordered.begin(), ordered.end(), [](const TextLine* a, const TextLine* b) {
        if (a->box.y != b->box.y) return a->box.y < b->box.y;
        return a->box.x < b->box.x;
    });

    std::vector<const TextLine*> headers;
    for (const TextLine* ln : ordered) {
        if (isHeaderLine(ln->text, headerRe)) headers.push_back(ln);
    }
    if (headers.empty()) return entries;

    const int x0 = (std::max)(0, cfg.padLr);
    const int x1 = (std::max)(1, frameW - cfg.padLr);
    const int width = (std::max)(1, x1 - x0);

    entries.reserve(headers.size());
    for (size_t i = 0; i < headers.size(); ++i) {
        const TextLine& hdr = *headers[i];
        const int hy = hdr.box.y;

        int end = frameH;
        if (i + 1 < headers.size()) {
            end = (std::min)(headers[i + 1]->box.y, hy + cfg.maxHeight);
        }

        const int y0 = (std::max)(0, hy - cfg.padV);
        const int y1 = (std::min)(frameH, end + cfg.padV);

        LogEntry e;
        e.box = BBox{x0, y0, width, (std::max)(1, y1 - y0)};
        e.headerText = hdr.text;
        e.headerBox = hdr.box;
        entries.push_back(std::move(e));
    }
    return entries;
}

} // namespace log_watchdog::detect
