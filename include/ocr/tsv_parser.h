#pragma once
/**
 * @file tsv_parser.h
 * @brief Parser for Tesseract TSV word data
 */

#include "types.h"
#include <string>
#include <vector>

namespace log_watchdog {

/**
 * @brief Parse word rows (level 5) from Tesseract TSV output
 *
 * Columns: level page_num block_num par_num line_num word_num
 *          left top width height conf text
 *
 * An optional header row is skipped. Rows with fewer than 11 columns or
 * non-numeric geometry are ignored. An unparsable confidence becomes -1;
 * fractional confidences are truncated.
 */
std::vector<OcrWord> parseTsvWords(const std::string& tsv);

} // namespace log_watchdog
