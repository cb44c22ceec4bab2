#include "image_preprocessing.h"

#include <opencv2/imgproc.hpp>

cv::Mat toGrayscale(const cv::Mat& image) {
    cv::Mat gray_image;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray_image, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray_image, cv::COLOR_BGRA2GRAY);
    } else {
        gray_image = image.clone();
    }

    if (gray_image.depth() != CV_8U) {
        gray_image.convertTo(gray_image, CV_8U);
    }
    return gray_image;
}

cv::Mat enhanceContrast(const cv::Mat& image, double gain) {
    cv::Mat enhanced;
    // convertTo saturates, so bright pixels clamp at 255
    image.convertTo(enhanced, -1, gain, 0.0);
    return enhanced;
}

cv::Mat resizeToSquare(const cv::Mat& image, int side) {
    cv::Mat resized;
    int interpolation = (image.cols > side || image.rows > side) ? cv::INTER_AREA : cv::INTER_CUBIC;
    cv::resize(image, resized, cv::Size(side, side), 0, 0, interpolation);
    return resized;
}

cv::Mat binarize(const cv::Mat& gray) {
    cv::Mat binary;
    cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    return binary;
}

cv::Mat invertImage(const cv::Mat& image) {
    cv::Mat inverted;
    cv::bitwise_not(image, inverted);
    return inverted;
}
