/**
 * @file tesseract_engine.cpp
 * @brief Tesseract backend implementation
 */

#include "ocr/tesseract_engine.h"
#include "ocr/tsv_parser.h"
#include "processing/roi_extractor.h"
#include "utils/logger.h"

#include <tesseract/baseapi.h>

#include <algorithm>
#include <cstdlib>

namespace log_watchdog {

TesseractEngine::TesseractEngine()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config() {}

TesseractEngine::TesseractEngine(const TesseractConfig& config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config) {}

TesseractEngine::~TesseractEngine() {
    if (m_tesseract) {
        m_tesseract->End();
    }
}

bool TesseractEngine::initialize() {
    if (m_initialized) {
        return true;
    }

    // Priority: config path, then TESSDATA_PREFIX / compiled-in default
    const char* tessDataPath = nullptr;
    if (!m_config.tessDataPath.empty()) {
        tessDataPath = m_config.tessDataPath.c_str();
    } else if (std::getenv("TESSDATA_PREFIX") == nullptr) {
        logDebug("TESSDATA_PREFIX not set, using tesseract default data path");
    }

    int result = m_tesseract->Init(tessDataPath, m_config.language.c_str(),
                                   tesseract::OEM_LSTM_ONLY);
    if (result != 0) {
        m_lastError = "Failed to initialize Tesseract with language: " + m_config.language;
        return false;
    }

    m_tesseract->SetVariable("preserve_interword_spaces", "1");
    m_initialized = true;
    return true;
}

std::string TesseractEngine::getVersion() {
    return tesseract::TessBaseAPI::Version();
}

bool TesseractEngine::recognize(const cv::Mat& image, const OcrParams& params,
                                std::vector<OcrWord>& words) {
    words.clear();

    if (!m_initialized) {
        m_lastError = "Tesseract not initialized";
        return false;
    }
    if (image.empty()) {
        return true;
    }
    if (params.psm < 0 || params.psm >= tesseract::PSM_COUNT) {
        m_lastError = "Invalid page segmentation mode: " + std::to_string(params.psm);
        return false;
    }

    cv::Mat gray;
    try {
        gray = preprocessGray(scaleForOcr(image, params.scale));
    } catch (const cv::Exception& e) {
        m_lastError = std::string("Preprocessing failed: ") + e.what();
        return false;
    }
    if (!gray.isContinuous()) {
        gray = gray.clone();
    }

    std::string whitelist = params.whitelist;
    whitelist.erase(std::remove(whitelist.begin(), whitelist.end(), '"'), whitelist.end());

    m_tesseract->SetPageSegMode(static_cast<tesseract::PageSegMode>(params.psm));
    m_tesseract->SetVariable("tessedit_char_whitelist", whitelist.c_str());
    m_tesseract->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));

    if (m_tesseract->Recognize(nullptr) != 0) {
        m_lastError = "Tesseract recognition failed";
        m_tesseract->Clear();
        return false;
    }

    char* tsv = m_tesseract->GetTSVText(0);
    if (tsv != nullptr) {
        words = parseTsvWords(tsv);
        delete[] tsv;
    }
    m_tesseract->Clear();
    return true;
}

} // namespace log_watchdog
