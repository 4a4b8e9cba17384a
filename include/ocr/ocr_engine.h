#pragma once
/**
 * @file ocr_engine.h
 * @brief OCR collaborator interface
 */

#include "types.h"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace log_watchdog {

/**
 * @brief Per-call recognition settings
 */
struct OcrParams {
    int psm = 6;                ///< Tesseract page segmentation mode
    double scale = 1.0;         ///< Resize factor applied before recognition
    std::string whitelist;      ///< Allowed characters (empty = all)
};

/**
 * @brief Recognizes words with boxes and structural indices
 *
 * Word boxes are in the coordinates of the (scaled) image handed to the
 * engine.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    /**
     * @brief Recognize words in a BGR or grayscale image
     * @param image Input image
     * @param params Recognition settings
     * @param words Output words (cleared first)
     * @return false on engine failure (see getLastError())
     */
    virtual bool recognize(const cv::Mat& image, const OcrParams& params,
                           std::vector<OcrWord>& words) = 0;

    virtual const std::string& getLastError() const = 0;
};

} // namespace log_watchdog
