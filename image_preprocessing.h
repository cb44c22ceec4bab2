#ifndef IMAGE_PREPROCESSING_H
#define IMAGE_PREPROCESSING_H

#include <opencv2/opencv.hpp>

// 8-bit single channel copy of a BGR, BGRA or gray image.
cv::Mat toGrayscale(const cv::Mat& image);

// Linear per-pixel gain, saturated at 255.
cv::Mat enhanceContrast(const cv::Mat& image, double gain);

cv::Mat resizeToSquare(const cv::Mat& image, int side);

// Otsu binarization, used before the last OCR attempt.
cv::Mat binarize(const cv::Mat& gray);

cv::Mat invertImage(const cv::Mat& image);

#endif // IMAGE_PREPROCESSING_H
