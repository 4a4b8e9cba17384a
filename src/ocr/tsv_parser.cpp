/**
 * @file tsv_parser.cpp
 * @brief Tesseract TSV word data parsing
 */

#include "ocr/tsv_parser.h"
#include "utils/string_utils.h"

#include <cmath>
#include <optional>
#include <sstream>

namespace log_watchdog {

static constexpr int kWordLevel = 5;

static std::optional<int> parseIntField(const std::string& s) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (!trim(s.substr(pos)).empty()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static int parseConfidence(const std::string& s) {
    try {
        double v = std::stod(s);
        if (!std::isfinite(v)) return -1;
        return static_cast<int>(v);
    } catch (const std::exception&) {
        return -1;
    }
}

std::vector<OcrWord> parseTsvWords(const std::string& tsv) {
    std::vector<OcrWord> words;
    std::istringstream in(tsv);
    std::string row;

    while (std::getline(in, row)) {
        if (!row.empty() && row.back() == '\r') row.pop_back();
        if (row.empty()) continue;

        std::vector<std::string> cols = splitString(row, '\t');
        if (cols.size() < 11) continue;

        auto level = parseIntField(cols[0]);
        if (!level || *level != kWordLevel) continue;   // header row or non-word level

        int nums[10];
        bool ok = true;
        for (int i = 0; i < 10 && ok; ++i) {
            auto v = parseIntField(cols[static_cast<size_t>(i)]);
            if (!v) ok = false;
            else nums[i] = *v;
        }
        if (!ok) continue;

        OcrWord w;
        w.page = nums[1];
        w.block = nums[2];
        w.paragraph = nums[3];
        w.line = nums[4];
        w.word = nums[5];
        w.box = BBox{nums[6], nums[7], nums[8], nums[9]};
        w.confidence = parseConfidence(cols[10]);
        w.text = cols.size() > 11 ? cols[11] : std::string{};
        // text containing tabs is split by the column split; rejoin it
        for (size_t i = 12; i < cols.size(); ++i) {
            w.text += '\t';
            w.text += cols[i];
        }
        words.push_back(std::move(w));
    }
    return words;
}

} // namespace log_watchdog
