/**
 * @file image_file_capture.cpp
 * @brief Still image used as the virtual screen (--image)
 */

#include "capture/screen_capture.h"
#include "processing/roi_extractor.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace log_watchdog {

bool ImageFileCapture::initialize() {
    try {
        m_image = cv::imread(m_path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        m_lastError = std::string("Failed to read image: ") + e.what();
        return false;
    }
    if (m_image.empty()) {
        m_lastError = "Failed to load image: " + m_path;
        return false;
    }
    return true;
}

void ImageFileCapture::getScreenSize(int& width, int& height) const {
    width = m_image.cols;
    height = m_image.rows;
}

bool ImageFileCapture::capture(const ROI& roi, cv::Mat& out) {
    if (m_image.empty()) {
        m_lastError = "No image loaded";
        return false;
    }
    ROI r = clampROIToFrame(roi, m_image.cols, m_image.rows);
    out = m_image(cv::Rect(r.x, r.y, r.w, r.h)).clone();
    return true;
}

} // namespace log_watchdog
