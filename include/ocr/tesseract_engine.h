#pragma once
/**
 * @file tesseract_engine.h
 * @brief Tesseract LSTM backend for the OCR collaborator
 */

#include "ocr/ocr_engine.h"

#include <memory>
#include <string>

namespace tesseract {
class TessBaseAPI;
}

namespace log_watchdog {

/**
 * @brief Tesseract initialization options
 */
struct TesseractConfig {
    std::string language = "eng";   ///< Language code (e.g., "eng")
    std::string tessDataPath;       ///< Empty = TESSDATA_PREFIX or library default
};

/**
 * @brief OCR engine backed by tesseract::TessBaseAPI
 *
 * Images are scaled, converted to gray, CLAHE-enhanced and blurred before
 * recognition. Words are read from the TSV renderer so that each word keeps
 * its page/block/paragraph/line/word indices.
 *
 * Example usage:
 * @code
 * log_watchdog::TesseractEngine engine;
 * if (engine.initialize()) {
 *     std::vector<log_watchdog::OcrWord> words;
 *     engine.recognize(image, {6, 2.0, ""}, words);
 * }
 * @endcode
 */
class TesseractEngine : public OcrEngine {
public:
    TesseractEngine();
    explicit TesseractEngine(const TesseractConfig& config);
    ~TesseractEngine() override;

    // Tesseract API is not copyable
    TesseractEngine(const TesseractEngine&) = delete;
    TesseractEngine& operator=(const TesseractEngine&) = delete;

    /**
     * @brief Initialize the OCR engine (LSTM only)
     * @return true if initialization was successful
     */
    bool initialize();

    bool isInitialized() const { return m_initialized; }

    bool recognize(const cv::Mat& image, const OcrParams& params,
                   std::vector<OcrWord>& words) override;

    const std::string& getLastError() const override { return m_lastError; }

    /**
     * @brief Tesseract library version string
     */
    static std::string getVersion();

private:
    std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
    TesseractConfig m_config;
    bool m_initialized = false;
    std::string m_lastError;
};

} // namespace log_watchdog
