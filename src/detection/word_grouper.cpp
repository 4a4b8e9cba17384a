/**
 * @file word_grouper.cpp
 * @brief OCR word to line grouping
 */

#include "detection/word_grouper.h"
#include "utils/string_utils.h"

#include <algorithm>
#include <map>
#include <tuple>

namespace log_watchdog::detect {

namespace {

using LineKey = std::tuple<int, int, int, int>;

float median(std::vector<float> values) {
    if (values.empty()) return 0.0f;
    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    if (n % 2 == 1) return values[n / 2];
    return (values[n / 2 - 1] + values[n / 2]) / 2.0f;
}

TextLine buildLine(std::vector<OcrWord> group) {
    // box.x and text make the order total for duplicated word indices
    std::sort(group.begin(), group.end(), [](const OcrWord& a, const OcrWord& b) {
        if (a.word != b.word) return a.word < b.word;
        if (a.box.x != b.box.x) return a.box.x < b.box.x;
        return a.text < b.text;
    });

    TextLine line;
    std::vector<float> confs;
    int x0 = group.front().box.x;
    int y0 = group.front().box.y;
    int x1 = group.front().box.right();
    int y1 = group.front().box.bottom();

    for (size_t i = 0; i < group.size(); ++i) {
        const OcrWord& w = group[i];
        if (i > 0) line.text.push_back(' ');
        line.text += w.text;
        if (w.confidence >= 0) confs.push_back(static_cast<float>(w.confidence));
        x0 = (std::min)(x0, w.box.x);
        y0 = (std::min)(y0, w.box.y);
        x1 = (std::max)(x1, w.box.right());
        y1 = (std::max)(y1, w.box.bottom());
    }

    line.confidence = median(confs);
    line.box = BBox{x0, y0, (std::max)(1, x1 - x0), (std::max)(1, y1 - y0)};
    return line;
}

} // namespace

std::vector<TextLine> groupWordsIntoLines(const std::vector<OcrWord>& words, int minWordConf) {
    std::map<LineKey, std::vector<OcrWord>> groups;

    for (const auto& w : words) {
        std::string txt = trim(w.text);
        if (txt.empty()) continue;
        if (w.confidence >= 0 && w.confidence < minWordConf) continue;

        OcrWord kept = w;
        kept.text = std::move(txt);
        groups[LineKey{w.page, w.block, w.paragraph, w.line}].push_back(std::move(kept));
    }

    std::vector<TextLine> lines;
    lines.reserve(groups.size());
    for (auto& kv : groups) {
        lines.push_back(buildLine(std::move(kv.second)));
    }

    // Full key so that logically identical input always yields the same order.
    std::sort(lines.begin(), lines.end(), [](const TextLine& a, const TextLine& b) {
        if (a.box.y != b.box.y) return a.box.y < b.box.y;
        if (a.box.x != b.box.x) return a.box.x < b.box.x;
        return a.text < b.text;
    });
    return lines;
}

std::string joinLinesText(const std::vector<TextLine>& lines) {
    std::string out;
    for (const auto& ln : lines) {
        if (!out.empty()) out.push_back(' ');
        out += ln.text;
    }
    return trim(out);
}

float medianLineConfidence(const std::vector<TextLine>& lines) {
    std::vector<float> confs;
    confs.reserve(lines.size());
    for (const auto& ln : lines) confs.push_back(ln.confidence);
    return median(confs);
}

} // namespace log_watchdog::detect
