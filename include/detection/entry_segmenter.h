#pragma once
/**
 * @file entry_segmenter.h
 * @brief Splits OCR lines into log entries at timestamp header lines
 */

#include "types.h"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace log_watchdog::detect {

/**
 * @brief Padding and height limits for entry boxes
 */
struct EntrySegmentConfig {
    int padLr = 4;          ///< Trimmed from the left and right frame edges
    int padV = 0;           ///< Added above the header and below the end
    int maxHeight = 360;    ///< Cap on the distance to the next header
};

/**
 * @brief Compile a user pattern into a std::regex
 *
 * A leading inline "(?i)" flag is removed and turns on case-insensitive
 * matching (ECMAScript grammar has no inline flags).
 *
 * @param pattern Pattern text
 * @param forceIcase Always compile case-insensitive
 * @return Compiled regex, or nullopt if the pattern is empty or malformed
 */
std::optional<std::regex> compilePattern(const std::string& pattern, bool forceIcase);

/**
 * @brief Compile the entry header pattern
 *
 * A malformed pattern logs a warning and falls back to a case-insensitive
 * "\bday\b" so the loop keeps running.
 */
std::regex compileHeaderRegex(const std::string& pattern);

/**
 * @brief True if @p text contains a header match
 */
bool isHeaderLine(const std::string& text, const std::regex& headerRe);

/**
 * @brief Split ordered lines into entries
 *
 * Entry i starts at header_i.y - padV (floored at 0). Entries followed by
 * another header end at min(next.y, header_i.y + maxHeight) + padV; the last
 * entry runs to the frame bottom. Both ends are clamped into the frame.
 * Horizontally the entry spans the frame minus padLr on each side.
 *
 * @param lines Lines sorted by (box.y, box.x)
 * @param frameW Frame width
 * @param frameH Frame height
 * @param headerRe Header pattern
 * @param cfg Padding configuration
 * @return Entries in ascending header y; empty if no header was found
 */
std::vector<LogEntry> segmentEntries(const std::vector<TextLine>& lines,
                                     int frameW, int frameH,
                                     const std::regex& headerRe,
                                     const EntrySegmentConfig& cfg);

} // namespace log_watchdog::detect
