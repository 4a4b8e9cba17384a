#pragma once
/**
 * @file screen_capture.h
 * @brief Screen capture collaborator interface and still-image source
 */

#include "types.h"

#include <opencv2/core.hpp>
#include <string>

namespace log_watchdog {

/**
 * @brief Captures rectangles of the full virtual screen
 */
class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;

    /**
     * @brief Prepare the capture backend
     * @return true if successful
     */
    virtual bool initialize() = 0;

    /**
     * @brief Size of the virtual screen
     */
    virtual void getScreenSize(int& width, int& height) const = 0;

    /**
     * @brief Capture a rectangle as 3-channel BGR
     *
     * The rectangle is clamped into the screen (width/height >= 1) first.
     *
     * @param roi Rectangle relative to the virtual screen origin
     * @param out Captured pixels
     * @return true if successful
     */
    virtual bool capture(const ROI& roi, cv::Mat& out) = 0;

    /**
     * @brief Get last error message
     */
    virtual const std::string& getLastError() const = 0;
};

/**
 * @brief Offline source: a still image file stands in for the screen
 */
class ImageFileCapture : public ScreenCapture {
public:
    explicit ImageFileCapture(std::string path) : m_path(std::move(path)) {}

    bool initialize() override;
    void getScreenSize(int& width, int& height) const override;
    bool capture(const ROI& roi, cv::Mat& out) override;
    const std::string& getLastError() const override { return m_lastError; }

private:
    std::string m_path;
    cv::Mat m_image;
    std::string m_lastError;
};

} // namespace log_watchdog
