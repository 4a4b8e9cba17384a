#pragma once
/**
 * @file x11_capture.h
 * @brief Xlib screen capture of the root window
 */

#include "capture/screen_capture.h"

#include <memory>
#include <string>

namespace log_watchdog {

/**
 * @brief Captures from the root window of an X display
 *
 * The root window covers every monitor, so ROI coordinates are virtual
 * screen coordinates.
 */
class X11ScreenCapture : public ScreenCapture {
public:
    /**
     * @param displayName Display to open (empty = $DISPLAY)
     */
    explicit X11ScreenCapture(std::string displayName = {});
    ~X11ScreenCapture() override;

    // Non-copyable
    X11ScreenCapture(const X11ScreenCapture&) = delete;
    X11ScreenCapture& operator=(const X11ScreenCapture&) = delete;

    bool initialize() override;
    void getScreenSize(int& width, int& height) const override;
    bool capture(const ROI& roi, cv::Mat& out) override;
    const std::string& getLastError() const override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace log_watchdog
