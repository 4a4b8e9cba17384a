/**
 * @file roi_extractor.cpp
 * @brief CPU region helpers used around the OCR passes
 */

#include "processing/roi_extractor.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace log_watchdog {

ROI clampROIToFrame(const ROI& roi, int frameW, int frameH) {
    ROI out = roi;
    if (frameW <= 0 || frameH <= 0) return out;

    out.x = (std::max)(0, out.x);
    out.y = (std::max)(0, out.y);
    out.w = (std::max)(1, out.w);
    out.h = (std::max)(1, out.h);

    if (out.x >= frameW) out.x = frameW - 1;
    if (out.y >= frameH) out.y = frameH - 1;
    if (out.x + out.w > frameW) out.w = (std::max)(1, frameW - out.x);
    if (out.y + out.h > frameH) out.h = (std::max)(1, frameH - out.y);
    return out;
}

BBox clampBoxToImage(const BBox& box, int imageW, int imageH) {
    ROI r;
    r.x = box.x; r.y = box.y; r.w = box.w; r.h = box.h;
    r = clampROIToFrame(r, imageW, imageH);
    return BBox{r.x, r.y, r.w, r.h};
}

cv::Mat cropRegion(const cv::Mat& image, const BBox& box) {
    if (image.empty()) return cv::Mat();
    BBox b = clampBoxToImage(box, image.cols, image.rows);
    return image(cv::Rect(b.x, b.y, b.w, b.h));
}

cv::Mat scaleForOcr(const cv::Mat& image, double scale) {
    if (image.empty() || scale <= 0.0 || scale == 1.0) return image;
    cv::Mat out;
    cv::resize(image, out, cv::Size(), scale, scale, cv::INTER_CUBIC);
    return out;
}

cv::Mat preprocessGray(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }

    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(2.0, cv::Size(8, 8));
    clahe->apply(gray, gray);
    cv::GaussianBlur(gray, gray, cv::Size(3, 3), 0);
    return gray;
}

BBox tightenToTextColumns(const cv::Mat& scaledImage, const BBox& box, int padLr) {
    cv::Mat slice = cropRegion(scaledImage, box);
    if (slice.empty()) return box;

    cv::Mat gray = preprocessGray(slice);
    cv::Mat mask;
    cv::threshold(gray, mask, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(11, 1));
    cv::dilate(mask, mask, kernel);

    cv::Mat colMax;
    cv::reduce(mask, colMax, 0, cv::REDUCE_MAX);

    int first = -1;
    int last = -1;
    for (int x = 0; x < colMax.cols; ++x) {
        if (colMax.at<uchar>(0, x) > 0) {
            if (first < 0) first = x;
            last = x;
        }
    }
    if (first < 0) return box;

    const BBox clamped = clampBoxToImage(box, scaledImage.cols, scaledImage.rows);
    const int x0Local = (std::max)(0, first - padLr);
    const int x1Local = (std::min)(mask.cols, last + 1 + padLr);

    BBox out = clamped;
    out.x = clamped.x + x0Local;
    out.w = (std::max)(1, x1Local - x0Local);
    return out;
}

} // namespace log_watchdog
