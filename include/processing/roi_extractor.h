#pragma once
/**
 * @file roi_extractor.h
 * @brief Region clamping, cropping and OCR preprocessing on CPU images
 */

#include "types.h"

#include <opencv2/core.hpp>

namespace log_watchdog {

/**
 * @brief Clamp a ROI into [0, frameW) x [0, frameH), width/height >= 1
 */
ROI clampROIToFrame(const ROI& roi, int frameW, int frameH);

/**
 * @brief Clamp a box into an image of the given size, width/height >= 1
 */
BBox clampBoxToImage(const BBox& box, int imageW, int imageH);

/**
 * @brief Crop (view, not copy) a box out of an image after clamping
 * @return Empty Mat if the image is empty
 */
cv::Mat cropRegion(const cv::Mat& image, const BBox& box);

/**
 * @brief Resize by @p scale with cubic interpolation (no-op for 1.0 or <= 0)
 */
cv::Mat scaleForOcr(const cv::Mat& image, double scale);

/**
 * @brief Grayscale + CLAHE (clip 2.0, 8x8) + 3x3 Gaussian blur
 *
 * Light enhancement for UI text before Tesseract.
 */
cv::Mat preprocessGray(const cv::Mat& image);

/**
 * @brief Narrow a box horizontally to the columns that contain ink
 *
 * Otsu threshold on the preprocessed slice, 11x1 horizontal dilation, then the
 * span of non-empty columns widened by @p padLr on each side. Returns the box
 * unchanged when the slice is empty or contains no ink.
 */
BBox tightenToTextColumns(const cv::Mat& scaledImage, const BBox& box, int padLr);

} // namespace log_watchdog
