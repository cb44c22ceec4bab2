#ifndef TEXT_RECOGNIZER_H
#define TEXT_RECOGNIZER_H

#include <memory>
#include <string>
#include <vector>

#include <tesseract/baseapi.h>

#include "decoder_adapter.h"

// Tesseract LSTM recognition over a whole grayscale image.
class TesseractTextCapability : public DecodeCapability {
public:
    // Throws std::runtime_error if the language data cannot be loaded.
    TesseractTextCapability(const std::string& data_path, const std::string& language);
    ~TesseractTextCapability() override;

    // non-copyable (Tesseract is stateful)
    TesseractTextCapability(const TesseractTextCapability&) = delete;
    TesseractTextCapability& operator=(const TesseractTextCapability&) = delete;

    std::vector<DecodedPayload> decode(const cv::Mat& gray_image) override;
    std::string name() const override;

private:
    std::unique_ptr<tesseract::TessBaseAPI> api;
};

#endif // TEXT_RECOGNIZER_H
