/**
 * @file x11_capture.cpp
 * @brief Root window capture via XGetImage
 */

#include "capture/x11_capture.h"
#include "processing/roi_extractor.h"

#include <opencv2/imgproc.hpp>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <cstdint>

namespace log_watchdog {

namespace {

int g_lastXError = 0;

// Default Xlib handler exits the process; record the code instead.
int onXError(Display*, XErrorEvent* ev) {
    g_lastXError = ev ? ev->error_code : -1;
    return 0;
}

int maskShift(unsigned long mask) {
    int shift = 0;
    if (mask == 0) return 0;
    while ((mask & 1UL) == 0) {
        mask >>= 1;
        ++shift;
    }
    return shift;
}

} // namespace

class X11ScreenCapture::Impl {
public:
    std::string displayName;
    Display* display = nullptr;
    Window root = 0;
    int width = 0;
    int height = 0;
    std::string lastError;

    ~Impl() {
        if (display) {
            XCloseDisplay(display);
            display = nullptr;
        }
    }

    bool convert(XImage* img, cv::Mat& out) {
        const int w = img->width;
        const int h = img->height;

        if (img->bits_per_pixel == 32 && img->byte_order == LSBFirst &&
            img->red_mask == 0xff0000 && img->green_mask == 0x00ff00 && img->blue_mask == 0x0000ff) {
            cv::Mat bgra(h, w, CV_8UC4, img->data, static_cast<size_t>(img->bytes_per_line));
            cv::cvtColor(bgra, out, cv::COLOR_BGRA2BGR);
            return true;
        }

        if (img->red_mask == 0 || img->green_mask == 0 || img->blue_mask == 0) {
            lastError = "Unsupported X visual (no RGB masks)";
            return false;
        }

        const int rs = maskShift(img->red_mask);
        const int gs = maskShift(img->green_mask);
        const int bs = maskShift(img->blue_mask);
        const double rMax = static_cast<double>(img->red_mask >> rs);
        const double gMax = static_cast<double>(img->green_mask >> gs);
        const double bMax = static_cast<double>(img->blue_mask >> bs);

        out.create(h, w, CV_8UC3);
        for (int y = 0; y < h; ++y) {
            uint8_t* row = out.ptr<uint8_t>(y);
            for (int x = 0; x < w; ++x) {
                unsigned long px = XGetPixel(img, x, y);
                row[x * 3 + 0] = static_cast<uint8_t>(((px & img->blue_mask) >> bs) * 255.0 / bMax);
                row[x * 3 + 1] = static_cast<uint8_t>(((px & img->green_mask) >> gs) * 255.0 / gMax);
                row[x * 3 + 2] = static_cast<uint8_t>(((px & img->red_mask) >> rs) * 255.0 / rMax);
            }
        }
        return true;
    }
};

X11ScreenCapture::X11ScreenCapture(std::string displayName)
    : m_impl(std::make_unique<Impl>()) {
    m_impl->displayName = std::move(displayName);
}

X11ScreenCapture::~X11ScreenCapture() = default;

bool X11ScreenCapture::initialize() {
    if (m_impl->display) return true;

    XSetErrorHandler(onXError);

    const char* name = m_impl->displayName.empty() ? nullptr : m_impl->displayName.c_str();
    m_impl->display = XOpenDisplay(name);
    if (!m_impl->display) {
        m_impl->lastError = "Cannot open X display" +
            (m_impl->displayName.empty() ? std::string{} : " " + m_impl->displayName);
        return false;
    }

    m_impl->root = DefaultRootWindow(m_impl->display);
    XWindowAttributes attrs{};
    if (!XGetWindowAttributes(m_impl->display, m_impl->root, &attrs)) {
        m_impl->lastError = "XGetWindowAttributes failed on root window";
        return false;
    }
    m_impl->width = attrs.width;
    m_impl->height = attrs.height;
    return true;
}

void X11ScreenCapture::getScreenSize(int& width, int& height) const {
    width = m_impl->width;
    height = m_impl->height;
}

bool X11ScreenCapture::capture(const ROI& roi, cv::Mat& out) {
    if (!m_impl->display) {
        m_impl->lastError = "Capture not initialized";
        return false;
    }

    ROI r = clampROIToFrame(roi, m_impl->width, m_impl->height);

    g_lastXError = 0;
    XImage* img = XGetImage(m_impl->display, m_impl->root, r.x, r.y,
                            static_cast<unsigned int>(r.w), static_cast<unsigned int>(r.h),
                            AllPlanes, ZPixmap);
    if (!img) {
        m_impl->lastError = "XGetImage failed (X error " + std::to_string(g_lastXError) + ")";
        return false;
    }

    bool ok = false;
    try {
        ok = m_impl->convert(img, out);
    } catch (const cv::Exception& e) {
        m_impl->lastError = std::string("Pixel conversion failed: ") + e.what();
    }
    XDestroyImage(img);
    return ok;
}

const std::string& X11ScreenCapture::getLastError() const {
    return m_impl->lastError;
}

} // namespace log_watchdog
