#pragma once
/**
 * @file word_grouper.h
 * @brief Groups OCR words into text lines
 *
 * Words are grouped by their structural indices from the OCR engine
 * (page, block, paragraph, line), not by geometry, so grouping is stable
 * for the same recognition result regardless of input order.
 */

#include "types.h"
#include <vector>

namespace log_watchdog::detect {

/**
 * @brief Group words into lines
 *
 * - Words with empty trimmed text are dropped.
 * - Words with a known confidence below @p minWordConf are dropped;
 *   unknown confidence (-1) is always kept.
 * - Within a line, words are joined with single spaces in word-index order.
 * - Line confidence is the median of valid (>= 0) word confidences, 0 if none.
 * - Line box is the union of word boxes with width/height floored at 1.
 *
 * @param words Raw OCR words
 * @param minWordConf Minimum word confidence (0-100)
 * @return Lines sorted by (box.y, box.x)
 */
std::vector<TextLine> groupWordsIntoLines(const std::vector<OcrWord>& words, int minWordConf);

/**
 * @brief Space-joined text of lines in the given order (trimmed)
 */
std::string joinLinesText(const std::vector<TextLine>& lines);

/**
 * @brief Median of line confidences, 0 for no lines
 */
float medianLineConfidence(const std::vector<TextLine>& lines);

} // namespace log_watchdog::detect
